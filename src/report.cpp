#include "journalstat/report.hpp"

#include <algorithm>
#include <cstddef>
#include <iomanip>
#include <sstream>
#include <vector>

namespace journalstat {
namespace {

using Row = std::vector<std::string>;

// Table cells are single-line.
std::string flatten(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const unsigned char ch : value) {
    out.push_back(ch < 0x20 ? ' ' : static_cast<char>(ch));
  }
  return out;
}

std::string format_percent(double percent) {
  std::ostringstream os;
  os << std::fixed << std::setprecision(2) << percent;
  return os.str();
}

void print_rule(const std::vector<std::size_t>& widths, std::ostream& out) {
  out << '+';
  for (const std::size_t width : widths) {
    out << std::string(width + 2, '-') << '+';
  }
  out << '\n';
}

void print_row(const Row& row, const std::vector<std::size_t>& widths, std::ostream& out) {
  out << '|';
  for (std::size_t i = 0; i < widths.size(); ++i) {
    out << ' ' << row[i] << std::string(widths[i] - row[i].size(), ' ') << " |";
  }
  out << '\n';
}

void print_grid(const Row& header, const std::vector<Row>& rows, std::ostream& out) {
  std::vector<std::size_t> widths(header.size(), 0);
  for (std::size_t i = 0; i < header.size(); ++i) {
    widths[i] = header[i].size();
  }
  for (const Row& row : rows) {
    for (std::size_t i = 0; i < row.size(); ++i) {
      widths[i] = std::max(widths[i], row[i].size());
    }
  }

  print_rule(widths, out);
  print_row(header, widths, out);
  print_rule(widths, out);
  for (const Row& row : rows) {
    print_row(row, widths, out);
  }
  print_rule(widths, out);
}

}  // namespace

std::string escape_json_string(const std::string& value) {
  std::string out;
  out.reserve(value.size());
  for (const unsigned char ch : value) {
    switch (ch) {
      case '"':
        out += "\\\"";
        break;
      case '\\':
        out += "\\\\";
        break;
      case '\b':
        out += "\\b";
        break;
      case '\f':
        out += "\\f";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\r':
        out += "\\r";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        if (ch < 0x20) {
          static constexpr char kHex[] = "0123456789abcdef";
          out += "\\u00";
          out.push_back(kHex[ch >> 4]);
          out.push_back(kHex[ch & 0x0f]);
        } else {
          out.push_back(static_cast<char>(ch));
        }
    }
  }
  return out;
}

void print_table(const AnalysisResult& result, std::ostream& out) {
  out << "Journal statistics for " << result.label << '\n';

  if (!result.top_talkers.empty()) {
    out << "Top " << result.top_talkers.size() << " most frequent messages:\n";
    std::vector<Row> rows;
    rows.reserve(result.top_talkers.size());
    for (const TopTalker& entry : result.top_talkers) {
      rows.push_back({std::to_string(entry.rank), std::to_string(entry.count), flatten(entry.emitter),
                      entry.severity, flatten(entry.message)});
    }
    print_grid({"Rank", "Frequency", "Process", "Severity", "Message"}, rows, out);
  }

  if (!result.largest_messages.empty()) {
    out << "Top " << result.largest_messages.size() << " largest messages:\n";
    std::vector<Row> rows;
    rows.reserve(result.largest_messages.size());
    for (const LargeMessage& entry : result.largest_messages) {
      rows.push_back({std::to_string(entry.rank), std::to_string(entry.size), flatten(entry.message)});
    }
    print_grid({"Rank", "Size", "Message"}, rows, out);
  }

  if (!result.emitter_shares.empty()) {
    out << "Emitter share of " << result.total_records << " records:\n";
    std::vector<Row> rows;
    rows.reserve(result.emitter_shares.size());
    for (const EmitterShare& entry : result.emitter_shares) {
      rows.push_back({std::to_string(entry.rank), flatten(entry.emitter), std::to_string(entry.count),
                      format_percent(entry.percent)});
    }
    print_grid({"Rank", "Process", "Count", "Percent"}, rows, out);
  }

  if (result.read_error.has_value()) {
    out << "Input ended early: " << *result.read_error << '\n';
  }
}

void print_json(const AnalysisResult& result, std::ostream& out) {
  out << "{\n";
  out << "  \"input\": \"" << escape_json_string(result.label) << "\",\n";
  out << "  \"records_read\": " << result.records_read << ",\n";
  out << "  \"total_records\": " << result.total_records << ",\n";

  out << "  \"top_talkers\": [\n";
  for (std::size_t i = 0; i < result.top_talkers.size(); ++i) {
    const auto& entry = result.top_talkers[i];
    out << "    {\"rank\": " << entry.rank << ", \"count\": " << entry.count << ", \"process\": \""
        << escape_json_string(entry.emitter) << "\", \"severity\": \"" << entry.severity
        << "\", \"message\": \"" << escape_json_string(entry.message) << "\"}";
    if (i + 1 < result.top_talkers.size()) {
      out << ',';
    }
    out << '\n';
  }
  out << "  ],\n";

  out << "  \"largest_messages\": [\n";
  for (std::size_t i = 0; i < result.largest_messages.size(); ++i) {
    const auto& entry = result.largest_messages[i];
    out << "    {\"rank\": " << entry.rank << ", \"size\": " << entry.size << ", \"message\": \""
        << escape_json_string(entry.message) << "\"}";
    if (i + 1 < result.largest_messages.size()) {
      out << ',';
    }
    out << '\n';
  }
  out << "  ],\n";

  out << "  \"emitter_shares\": [\n";
  for (std::size_t i = 0; i < result.emitter_shares.size(); ++i) {
    const auto& entry = result.emitter_shares[i];
    out << "    {\"rank\": " << entry.rank << ", \"process\": \"" << escape_json_string(entry.emitter)
        << "\", \"count\": " << entry.count << ", \"percent\": " << format_percent(entry.percent) << "}";
    if (i + 1 < result.emitter_shares.size()) {
      out << ',';
    }
    out << '\n';
  }
  out << "  ],\n";

  out << "  \"read_error\": ";
  if (result.read_error.has_value()) {
    out << '"' << escape_json_string(*result.read_error) << '"';
  } else {
    out << "null";
  }
  out << "\n}\n";
}

}  // namespace journalstat
