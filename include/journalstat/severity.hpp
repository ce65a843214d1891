#pragma once

#include <optional>
#include <string_view>

namespace journalstat {

// syslog(3) priorities as carried in the journal PRIORITY field.
enum class Severity {
  Emergency = 0,
  Alert = 1,
  Critical = 2,
  Error = 3,
  Warn = 4,
  Notice = 5,
  Info = 6,
  Debug = 7,
};

std::optional<Severity> parse_severity(std::string_view code);
std::string_view severity_name(Severity severity);

// Total over all inputs: any code outside "0".."7" is "unknown".
std::string_view severity_name_for_code(std::string_view code);

}  // namespace journalstat
