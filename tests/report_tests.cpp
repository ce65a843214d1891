#include "journalstat/report.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <string>

namespace {

journalstat::AnalysisResult sample_result() {
  journalstat::AnalysisResult result;
  result.label = "/var/log/journal";
  result.records_read = 4;
  result.total_records = 3;
  result.top_talkers_requested = 2;
  result.large_messages_requested = 1;
  result.top_talkers = {
      {1, 2, "sshd", "info", "Accepted publickey"},
      {2, 1, "kernel", "error", "Out of memory"},
  };
  result.largest_messages = {{1, 18, "Accepted publickey"}};
  result.emitter_shares = {
      {1, "sshd", 2, 200.0 / 3.0},
      {2, "kernel", 1, 100.0 / 3.0},
  };
  return result;
}

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

}  // namespace

TEST_CASE("table output renders every requested section", "[report]") {
  std::ostringstream os;
  journalstat::print_table(sample_result(), os);
  const std::string text = os.str();

  REQUIRE(contains(text, "Journal statistics for /var/log/journal\n"));
  REQUIRE(contains(text, "Top 2 most frequent messages:\n"));
  REQUIRE(contains(text, "| Rank | Frequency | Process | Severity | Message            |\n"));
  REQUIRE(contains(text, "| 1    | 2         | sshd    | info     | Accepted publickey |\n"));
  REQUIRE(contains(text, "Top 1 largest messages:\n"));
  REQUIRE(contains(text, "| 1    | 18   | Accepted publickey |\n"));
  REQUIRE(contains(text, "Emitter share of 3 records:\n"));
  REQUIRE(contains(text, "| 1    | sshd    | 2     | 66.67   |\n"));
  REQUIRE(contains(text, "| 2    | kernel  | 1     | 33.33   |\n"));
  REQUIRE_FALSE(contains(text, "Input ended early"));
}

TEST_CASE("empty sections are omitted from the table output", "[report]") {
  journalstat::AnalysisResult result;
  result.label = "empty.export";

  std::ostringstream os;
  journalstat::print_table(result, os);

  REQUIRE(os.str() == "Journal statistics for empty.export\n");
}

TEST_CASE("table output notes a truncated input", "[report]") {
  journalstat::AnalysisResult result = sample_result();
  result.read_error = "truncated binary field MESSAGE";

  std::ostringstream os;
  journalstat::print_table(result, os);

  REQUIRE(contains(os.str(), "Input ended early: truncated binary field MESSAGE\n"));
}

TEST_CASE("multi-line messages stay on one table row", "[report]") {
  journalstat::AnalysisResult result;
  result.label = "x";
  result.largest_messages = {{1, 7, "a\nb\tc\r"}};

  std::ostringstream os;
  journalstat::print_table(result, os);

  REQUIRE(contains(os.str(), "| 1    | 7    | a b c   |\n"));
}

TEST_CASE("json output carries all artifacts", "[report]") {
  std::ostringstream os;
  journalstat::print_json(sample_result(), os);
  const std::string json = os.str();

  REQUIRE(contains(json, "\"input\": \"/var/log/journal\""));
  REQUIRE(contains(json, "\"total_records\": 3"));
  REQUIRE(contains(json,
                   "{\"rank\": 1, \"count\": 2, \"process\": \"sshd\", \"severity\": \"info\", "
                   "\"message\": \"Accepted publickey\"},"));
  REQUIRE(contains(json, "{\"rank\": 1, \"size\": 18, \"message\": \"Accepted publickey\"}\n"));
  REQUIRE(contains(json, "{\"rank\": 2, \"process\": \"kernel\", \"count\": 1, \"percent\": 33.33}\n"));
  REQUIRE(contains(json, "\"read_error\": null\n}"));
}

TEST_CASE("json strings are escaped", "[report]") {
  REQUIRE(journalstat::escape_json_string("say \"hi\"\\") == "say \\\"hi\\\"\\\\");
  REQUIRE(journalstat::escape_json_string("a\nb\tc") == "a\\nb\\tc");
  REQUIRE(journalstat::escape_json_string(std::string("\x01", 1)) == "\\u0001");
  REQUIRE(journalstat::escape_json_string("plain") == "plain");
}
