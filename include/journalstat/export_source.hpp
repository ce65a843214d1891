#pragma once

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "journalstat/log_source.hpp"

namespace journalstat {

// Reads the systemd Journal Export Format (journalctl -o export).
//
// `path` may be a single export file or a directory; a directory is read as
// the concatenation of its regular, non-hidden files sorted by name. Throws
// SourceOpenError if the path does not exist, the first file cannot be opened,
// the directory holds no files or the first entry is not in export format.
class ExportJournalSource : public LogSource {
 public:
  explicit ExportJournalSource(const std::filesystem::path& path);

  std::optional<LogRecord> next() override;
  std::string label() const override;

  const std::vector<std::filesystem::path>& files() const { return files_; }

 private:
  bool open_next_file();
  std::optional<LogRecord> read_next();
  std::optional<LogRecord> read_entry();
  std::string read_binary_value(const std::string& name);

  std::filesystem::path input_;
  std::vector<std::filesystem::path> files_;
  std::size_t next_file_ = 0;
  std::ifstream in_;
  std::optional<LogRecord> pending_;
};

}  // namespace journalstat
