#include "journalstat/severity.hpp"

namespace journalstat {

std::optional<Severity> parse_severity(std::string_view code) {
  if (code.size() != 1 || code[0] < '0' || code[0] > '7') {
    return std::nullopt;
  }
  return static_cast<Severity>(code[0] - '0');
}

std::string_view severity_name(Severity severity) {
  switch (severity) {
    case Severity::Emergency:
      return "emergency";
    case Severity::Alert:
      return "alert";
    case Severity::Critical:
      return "critical";
    case Severity::Error:
      return "error";
    case Severity::Warn:
      return "warn";
    case Severity::Notice:
      return "notice";
    case Severity::Info:
      return "info";
    case Severity::Debug:
      return "debug";
  }
  return "unknown";
}

std::string_view severity_name_for_code(std::string_view code) {
  const auto severity = parse_severity(code);
  if (!severity.has_value()) {
    return "unknown";
  }
  return severity_name(*severity);
}

}  // namespace journalstat
