#include "journalstat/rank_slots.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>

TEST_CASE("first-fit replaces the first lower slot without re-sorting", "[rank_slots]") {
  journalstat::RankSlots<std::string> slots(2);

  REQUIRE(slots.offer(1, "A"));
  REQUIRE(slots.offer(1, "B"));
  REQUIRE(slots.size() == 2);
  REQUIRE(slots.slots()[0].value == "A");
  REQUIRE(slots.slots()[1].value == "B");

  REQUIRE(slots.offer(2, "C"));
  REQUIRE(slots.slots()[0].score == 2);
  REQUIRE(slots.slots()[0].value == "C");

  REQUIRE(slots.offer(3, "D"));
  REQUIRE(slots.size() == 2);
  REQUIRE(slots.slots()[0].score == 3);
  REQUIRE(slots.slots()[0].value == "D");
  REQUIRE(slots.slots()[1].score == 1);
  REQUIRE(slots.slots()[1].value == "B");
}

TEST_CASE("equal scores never displace an occupied slot", "[rank_slots]") {
  journalstat::RankSlots<std::string> slots(1);
  REQUIRE(slots.offer(5, "first"));
  REQUIRE_FALSE(slots.offer(5, "second"));
  REQUIRE_FALSE(slots.offer(4, "third"));
  REQUIRE(slots.size() == 1);
  REQUIRE(slots.slots()[0].value == "first");
}

TEST_CASE("a higher score claims slot 0 even while slots are still free", "[rank_slots]") {
  journalstat::RankSlots<std::string> slots(3);
  REQUIRE(slots.offer(1, "a"));
  REQUIRE(slots.offer(2, "b"));
  REQUIRE(slots.size() == 1);
  REQUIRE(slots.slots()[0].value == "b");
}

TEST_CASE("stale lower scores of the same value survive in later slots", "[rank_slots]") {
  journalstat::RankSlots<std::string> slots(3);
  REQUIRE(slots.offer(1, "a"));
  REQUIRE(slots.offer(1, "x"));
  REQUIRE(slots.offer(2, "x"));

  REQUIRE(slots.size() == 2);
  REQUIRE(slots.slots()[0].value == "x");
  REQUIRE(slots.slots()[0].score == 2);
  REQUIRE(slots.slots()[1].value == "x");
  REQUIRE(slots.slots()[1].score == 1);
}

TEST_CASE("size never exceeds capacity", "[rank_slots]") {
  for (std::size_t capacity = 0; capacity <= 6; ++capacity) {
    journalstat::RankSlots<int> slots(capacity);
    for (std::uint64_t i = 0; i < 200; ++i) {
      slots.offer((i * 7919) % 31, static_cast<int>(i));
      REQUIRE(slots.size() <= capacity);
    }
  }
}

TEST_CASE("capacity zero never records anything", "[rank_slots]") {
  journalstat::RankSlots<std::string> slots(0);
  REQUIRE_FALSE(slots.offer(1, "a"));
  REQUIRE_FALSE(slots.offer(1000, "b"));
  REQUIRE(slots.empty());
  REQUIRE(slots.capacity() == 0);
}

TEST_CASE("huge capacity only allocates the slots that fill", "[rank_slots]") {
  journalstat::RankSlots<std::string> slots(std::numeric_limits<std::size_t>::max());
  REQUIRE(slots.offer(1, "a"));
  REQUIRE(slots.offer(1, "b"));
  REQUIRE(slots.offer(3, "c"));
  REQUIRE(slots.size() == 2);
  REQUIRE(slots.slots()[0].value == "c");
  REQUIRE(slots.capacity() == std::numeric_limits<std::size_t>::max());
}
