#pragma once

#include <optional>
#include <string>

#include "journalstat/log_record.hpp"

namespace journalstat {

// Sequential record reader. next() returns std::nullopt at end of stream and
// throws SourceReadError when the stream fails part way through.
class LogSource {
 public:
  virtual ~LogSource() = default;

  virtual std::optional<LogRecord> next() = 0;
  virtual std::string label() const = 0;
};

}  // namespace journalstat
