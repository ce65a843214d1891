#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "journalstat/log_record.hpp"

namespace journalstat {

// Exact occurrence count per identity. Grows with the number of distinct
// identities seen.
class FrequencyTable {
 public:
  // Returns the identity's count after the increment.
  std::uint64_t increment(const MessageIdentity& identity);
  std::uint64_t count(const MessageIdentity& identity) const;
  std::size_t size() const { return counts_.size(); }

 private:
  std::unordered_map<MessageIdentity, std::uint64_t, MessageIdentityHash> counts_;
};

class EmitterCounter {
 public:
  void increment(const std::string& emitter);
  std::uint64_t count(const std::string& emitter) const;
  std::uint64_t total() const;
  std::size_t size() const { return counts_.size(); }

  // Descending by count, ties in ascending emitter order.
  std::vector<std::pair<std::string, std::uint64_t>> ranked() const;

 private:
  std::unordered_map<std::string, std::uint64_t> counts_;
};

}  // namespace journalstat
