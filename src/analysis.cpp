#include "journalstat/analysis.hpp"

#include <spdlog/spdlog.h>

#include <utility>

#include "journalstat/errors.hpp"
#include "journalstat/severity.hpp"

namespace journalstat {

AnalysisEngine::AnalysisEngine(const AnalysisOptions& options)
    : filter_(options.unit, options.pattern),
      top_talkers_(options.top_talkers),
      largest_(options.large_messages) {
  spdlog::debug("engine: top_talkers={} large_messages={} unit={} pattern={}", options.top_talkers,
                options.large_messages, options.unit.value_or("<any>"), options.pattern.value_or("<none>"));
}

bool AnalysisEngine::observe(const LogRecord& record) {
  ++records_read_;
  if (!filter_.admits(record)) {
    return false;
  }

  MessageIdentity identity{*record.message, *record.emitter, *record.severity};

  const std::uint64_t count = frequency_.increment(identity);
  emitters_.increment(identity.emitter);
  ++total_records_;

  top_talkers_.offer(count, identity);
  largest_.offer(identity.message.size(), identity.message);
  return true;
}

AnalysisResult AnalysisEngine::run(LogSource& source) {
  std::optional<std::string> read_error;
  try {
    while (const auto record = source.next()) {
      observe(*record);
    }
  } catch (const SourceReadError& e) {
    spdlog::warn("input ended early after {} records: {}", records_read_, e.what());
    read_error = e.what();
  }

  spdlog::info("read {} records, admitted {} ({} distinct messages, {} emitters)", records_read_,
               total_records_, frequency_.size(), emitters_.size());

  AnalysisResult out = result(source.label());
  out.read_error = std::move(read_error);
  return out;
}

AnalysisResult AnalysisEngine::result(const std::string& label) const {
  AnalysisResult out;
  out.label = label;
  out.records_read = records_read_;
  out.total_records = total_records_;
  out.top_talkers_requested = top_talkers_.capacity();
  out.large_messages_requested = largest_.capacity();

  const auto& talkers = top_talkers_.slots();
  out.top_talkers.reserve(talkers.size());
  for (std::size_t i = 0; i < talkers.size(); ++i) {
    const MessageIdentity& identity = talkers[i].value;
    out.top_talkers.push_back(TopTalker{i + 1, talkers[i].score, identity.emitter,
                                        std::string(severity_name_for_code(identity.severity)),
                                        identity.message});
  }

  const auto& largest = largest_.slots();
  out.largest_messages.reserve(largest.size());
  for (std::size_t i = 0; i < largest.size(); ++i) {
    out.largest_messages.push_back(LargeMessage{i + 1, largest[i].score, largest[i].value});
  }

  if (total_records_ == 0) {
    return out;
  }

  const auto ranked = emitters_.ranked();
  out.emitter_shares.reserve(ranked.size());
  for (std::size_t i = 0; i < ranked.size(); ++i) {
    const double percent =
        static_cast<double>(ranked[i].second) / static_cast<double>(total_records_) * 100.0;
    out.emitter_shares.push_back(EmitterShare{i + 1, ranked[i].first, ranked[i].second, percent});
  }

  return out;
}

}  // namespace journalstat
