#include <CLI/CLI.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <exception>
#include <iostream>
#include <map>
#include <string>

#include "journalstat/analysis.hpp"
#include "journalstat/export_source.hpp"
#include "journalstat/report.hpp"

namespace {

constexpr int kExitFatal = 1;
constexpr int kExitPartial = 2;

void setup_logging(spdlog::level::level_enum level) {
  auto logger = spdlog::stderr_color_mt("journalstat");
  logger->set_pattern("%^[%l]%$ %v");
  logger->set_level(level);
  spdlog::set_default_logger(logger);
}

}  // namespace

int main(int argc, char** argv) {
  CLI::App app{"journalstat: summarize systemd journal exports"};

  journalstat::AnalysisOptions options;
  std::string input;
  std::string unit_raw;
  std::string pattern_raw;
  bool print_json_output = false;
  spdlog::level::level_enum log_level = spdlog::level::warn;

  const std::map<std::string, spdlog::level::level_enum> log_levels{
      {"trace", spdlog::level::trace}, {"debug", spdlog::level::debug}, {"info", spdlog::level::info},
      {"warn", spdlog::level::warn},   {"error", spdlog::level::err},   {"off", spdlog::level::off},
  };

  app.set_config("--config", "", "Read options from an INI or TOML file.");
  app.add_option("-i,--input", input, "Input journal export file or directory.")
      ->required()
      ->check(CLI::ExistingPath);
  app.add_option("-t,--top-talkers", options.top_talkers, "The number of top talkers to report on.")
      ->default_val(0)
      ->check(CLI::NonNegativeNumber);
  app.add_option("-l,--large-messages", options.large_messages, "The number of large messages to report on.")
      ->default_val(0)
      ->check(CLI::NonNegativeNumber);
  auto* unit_opt = app.add_option("-u,--unit", unit_raw, "Filter on a specific systemd unit.");
  auto* pattern_opt = app.add_option("-p,--pattern", pattern_raw, "Filter on messages matching this regex.");
  app.add_flag("--json", print_json_output, "Print JSON output.");
  app.add_option("--log-level", log_level, "Log verbosity: trace|debug|info|warn|error|off.")
      ->transform(CLI::CheckedTransformer(log_levels, CLI::ignore_case));

  CLI11_PARSE(app, argc, argv);

  setup_logging(log_level);

  if (unit_opt->count() > 0) {
    options.unit = unit_raw;
  }
  if (pattern_opt->count() > 0) {
    options.pattern = pattern_raw;
  }

  try {
    journalstat::AnalysisEngine engine(options);
    journalstat::ExportJournalSource source(input);
    const journalstat::AnalysisResult result = engine.run(source);

    if (print_json_output) {
      journalstat::print_json(result, std::cout);
    } else {
      journalstat::print_table(result, std::cout);
    }

    return result.read_error.has_value() ? kExitPartial : 0;
  } catch (const std::exception& e) {
    spdlog::error("{}", e.what());
    return kExitFatal;
  }
}
