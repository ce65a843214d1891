#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace journalstat {

// Fixed-capacity first-fit ranking.
//
// A candidate walks the slots from index 0 and takes the first slot that is
// either still unused or holds a strictly lower score. Nothing is re-sorted or
// shifted afterwards, so the sequence is only an approximate top-K: slot order
// is not rank order, and an older, lower-scored copy of a value may survive in
// another slot. A capacity of 0 records nothing.
template <typename T>
class RankSlots {
 public:
  struct Slot {
    std::uint64_t score = 0;
    T value;
  };

  // Slots are allocated as they fill, so a large capacity costs nothing up front.
  explicit RankSlots(std::size_t capacity) : capacity_(capacity) {}

  // Returns true if the candidate was stored.
  bool offer(std::uint64_t score, const T& value) {
    for (std::size_t i = 0; i < capacity_; ++i) {
      if (i == slots_.size()) {
        slots_.push_back(Slot{score, value});
        return true;
      }
      if (slots_[i].score < score) {
        slots_[i] = Slot{score, value};
        return true;
      }
    }
    return false;
  }

  const std::vector<Slot>& slots() const { return slots_; }
  std::size_t capacity() const { return capacity_; }
  std::size_t size() const { return slots_.size(); }
  bool empty() const { return slots_.empty(); }

 private:
  std::size_t capacity_;
  std::vector<Slot> slots_;
};

}  // namespace journalstat
