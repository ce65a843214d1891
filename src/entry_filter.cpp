#include "journalstat/entry_filter.hpp"

#include <utility>

#include "journalstat/errors.hpp"

namespace journalstat {

EntryFilter::EntryFilter(std::optional<std::string> unit, std::optional<std::string> pattern)
    : unit_(std::move(unit)), pattern_(std::move(pattern)) {
  if (pattern_.has_value()) {
    try {
      compiled_.emplace(*pattern_, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
      throw ConfigurationError("invalid --pattern expression '" + *pattern_ + "': " + e.what());
    }
  }
}

bool EntryFilter::admits(const LogRecord& record) const {
  if (!record.message.has_value() || !record.emitter.has_value() || !record.severity.has_value()) {
    return false;
  }

  if (unit_.has_value() && record.unit.has_value() && *record.unit != *unit_) {
    return false;
  }

  if (compiled_.has_value() && !std::regex_search(*record.message, *compiled_)) {
    return false;
  }

  return true;
}

}  // namespace journalstat
