#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace journalstat {

struct LogRecord {
  std::optional<std::string> message;
  std::optional<std::string> emitter;
  std::optional<std::string> severity;
  std::optional<std::string> unit;
};

struct MessageIdentity {
  std::string message;
  std::string emitter;
  std::string severity;

  bool operator==(const MessageIdentity& other) const {
    return message == other.message && emitter == other.emitter && severity == other.severity;
  }
  bool operator!=(const MessageIdentity& other) const { return !(*this == other); }
};

struct MessageIdentityHash {
  std::size_t operator()(const MessageIdentity& identity) const noexcept {
    const std::hash<std::string> hasher;
    std::size_t seed = hasher(identity.message);
    seed ^= hasher(identity.emitter) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    seed ^= hasher(identity.severity) + 0x9e3779b9 + (seed << 6) + (seed >> 2);
    return seed;
  }
};

}  // namespace journalstat
