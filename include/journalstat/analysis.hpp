#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "journalstat/counters.hpp"
#include "journalstat/entry_filter.hpp"
#include "journalstat/log_record.hpp"
#include "journalstat/log_source.hpp"
#include "journalstat/rank_slots.hpp"

namespace journalstat {

struct AnalysisOptions {
  std::size_t top_talkers = 0;
  std::size_t large_messages = 0;
  std::optional<std::string> unit;
  std::optional<std::string> pattern;
};

struct TopTalker {
  std::size_t rank = 0;
  std::uint64_t count = 0;
  std::string emitter;
  std::string severity;
  std::string message;
};

struct LargeMessage {
  std::size_t rank = 0;
  std::uint64_t size = 0;
  std::string message;
};

struct EmitterShare {
  std::size_t rank = 0;
  std::string emitter;
  std::uint64_t count = 0;
  double percent = 0.0;
};

struct AnalysisResult {
  std::string label;
  std::uint64_t records_read = 0;
  std::uint64_t total_records = 0;
  std::size_t top_talkers_requested = 0;
  std::size_t large_messages_requested = 0;
  std::vector<TopTalker> top_talkers;
  std::vector<LargeMessage> largest_messages;
  std::vector<EmitterShare> emitter_shares;
  std::optional<std::string> read_error;
};

// One single-pass aggregation. Each engine owns all of its state, so several
// can run side by side.
class AnalysisEngine {
 public:
  // Throws ConfigurationError if options.pattern does not compile.
  explicit AnalysisEngine(const AnalysisOptions& options);

  // Returns false if the record was filtered out or lacks required fields.
  bool observe(const LogRecord& record);

  // Drains `source`. A SourceReadError ends the pass early and is reported in
  // AnalysisResult::read_error together with everything read before it.
  AnalysisResult run(LogSource& source);

  AnalysisResult result(const std::string& label) const;

  std::uint64_t frequency(const MessageIdentity& identity) const { return frequency_.count(identity); }
  std::uint64_t records_read() const { return records_read_; }
  std::uint64_t total_records() const { return total_records_; }
  const EmitterCounter& emitters() const { return emitters_; }
  const RankSlots<MessageIdentity>& top_talkers() const { return top_talkers_; }
  const RankSlots<std::string>& largest_messages() const { return largest_; }

 private:
  EntryFilter filter_;
  FrequencyTable frequency_;
  EmitterCounter emitters_;
  RankSlots<MessageIdentity> top_talkers_;
  RankSlots<std::string> largest_;
  std::uint64_t records_read_ = 0;
  std::uint64_t total_records_ = 0;
};

}  // namespace journalstat
