#pragma once

#include <optional>
#include <regex>
#include <string>

#include "journalstat/log_record.hpp"

namespace journalstat {

class EntryFilter {
 public:
  // Throws ConfigurationError if `pattern` is not a valid regular expression.
  EntryFilter(std::optional<std::string> unit, std::optional<std::string> pattern);

  // Records lacking message, emitter or severity are never admitted. A record
  // without a unit tag passes the unit check.
  bool admits(const LogRecord& record) const;

  const std::optional<std::string>& unit() const { return unit_; }
  const std::optional<std::string>& pattern() const { return pattern_; }

 private:
  std::optional<std::string> unit_;
  std::optional<std::string> pattern_;
  std::optional<std::regex> compiled_;
};

}  // namespace journalstat
