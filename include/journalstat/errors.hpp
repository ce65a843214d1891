#pragma once

#include <stdexcept>
#include <string>

namespace journalstat {

// The input could not be opened; nothing was read.
class SourceOpenError : public std::runtime_error {
 public:
  explicit SourceOpenError(const std::string& what) : std::runtime_error(what) {}
};

// The input failed mid-stream. Whatever was read before still counts.
class SourceReadError : public std::runtime_error {
 public:
  explicit SourceReadError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigurationError : public std::invalid_argument {
 public:
  explicit ConfigurationError(const std::string& what) : std::invalid_argument(what) {}
};

}  // namespace journalstat
