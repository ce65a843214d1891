#include "journalstat/counters.hpp"

#include <algorithm>

namespace journalstat {

std::uint64_t FrequencyTable::increment(const MessageIdentity& identity) {
  return ++counts_[identity];
}

std::uint64_t FrequencyTable::count(const MessageIdentity& identity) const {
  const auto it = counts_.find(identity);
  return it == counts_.end() ? 0 : it->second;
}

void EmitterCounter::increment(const std::string& emitter) {
  ++counts_[emitter];
}

std::uint64_t EmitterCounter::count(const std::string& emitter) const {
  const auto it = counts_.find(emitter);
  return it == counts_.end() ? 0 : it->second;
}

std::uint64_t EmitterCounter::total() const {
  std::uint64_t sum = 0;
  for (const auto& [emitter, count] : counts_) {
    sum += count;
  }
  return sum;
}

std::vector<std::pair<std::string, std::uint64_t>> EmitterCounter::ranked() const {
  std::vector<std::pair<std::string, std::uint64_t>> entries(counts_.begin(), counts_.end());

  std::sort(entries.begin(), entries.end(), [](const auto& lhs, const auto& rhs) {
    if (lhs.second != rhs.second) {
      return lhs.second > rhs.second;
    }
    return lhs.first < rhs.first;
  });

  return entries;
}

}  // namespace journalstat
