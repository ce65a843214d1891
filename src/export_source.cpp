#include "journalstat/export_source.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstdint>
#include <string_view>
#include <system_error>
#include <utility>

#include "journalstat/errors.hpp"

namespace journalstat {
namespace {

namespace fs = std::filesystem;

// journald refuses fields larger than this, so anything bigger is corruption.
constexpr std::uint64_t kMaxFieldSize = 768ull * 1024 * 1024;

// Journal field names: A-Z, 0-9 and '_', not starting with a digit, at most
// 64 bytes.
bool is_valid_field_name(std::string_view name) {
  if (name.empty() || name.size() > 64 || (name.front() >= '0' && name.front() <= '9')) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](char ch) {
    return (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '_';
  });
}

bool is_hidden(const fs::path& path) {
  const std::string name = path.filename().string();
  return !name.empty() && name.front() == '.';
}

void assign_field(LogRecord& record, std::string_view name, std::string value) {
  if (name == "MESSAGE") {
    record.message = std::move(value);
  } else if (name == "_COMM") {
    record.emitter = std::move(value);
  } else if (name == "PRIORITY") {
    record.severity = std::move(value);
  } else if (name == "_SYSTEMD_UNIT") {
    record.unit = std::move(value);
  }
}

std::vector<fs::path> list_directory(const fs::path& dir) {
  std::vector<fs::path> files;
  std::error_code ec;
  for (fs::directory_iterator it(dir, ec), end; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    std::error_code type_ec;
    if (it->is_regular_file(type_ec) && !is_hidden(it->path())) {
      files.push_back(it->path());
    }
  }
  if (ec) {
    throw SourceOpenError("failed to read directory " + dir.string() + ": " + ec.message());
  }

  std::sort(files.begin(), files.end(),
            [](const fs::path& lhs, const fs::path& rhs) { return lhs.filename() < rhs.filename(); });
  return files;
}

}  // namespace

ExportJournalSource::ExportJournalSource(const fs::path& path) : input_(path) {
  std::error_code ec;
  const fs::file_status status = fs::status(path, ec);
  if (ec || !fs::exists(status)) {
    throw SourceOpenError("input does not exist: " + path.string());
  }

  if (fs::is_directory(status)) {
    files_ = list_directory(path);
    if (files_.empty()) {
      throw SourceOpenError("no journal export files in directory: " + path.string());
    }
  } else {
    files_.push_back(path);
  }

  if (!open_next_file()) {
    throw SourceOpenError("failed to open file: " + files_.front().string());
  }

  try {
    pending_ = read_next();
  } catch (const SourceReadError& e) {
    throw SourceOpenError(std::string("not a journal export stream: ") + e.what());
  }
  spdlog::debug("opened {} ({} file(s))", input_.string(), files_.size());
}

std::string ExportJournalSource::label() const {
  return input_.string();
}

std::optional<LogRecord> ExportJournalSource::next() {
  if (pending_.has_value()) {
    std::optional<LogRecord> record = std::move(pending_);
    pending_.reset();
    return record;
  }
  return read_next();
}

std::optional<LogRecord> ExportJournalSource::read_next() {
  while (true) {
    if (auto record = read_entry(); record.has_value()) {
      return record;
    }
    if (next_file_ >= files_.size()) {
      return std::nullopt;
    }

    const fs::path& path = files_[next_file_];
    if (!open_next_file()) {
      throw SourceReadError("failed to open file: " + path.string());
    }
    spdlog::debug("continuing with {}", path.string());
  }
}

bool ExportJournalSource::open_next_file() {
  if (in_.is_open()) {
    in_.close();
  }
  in_.clear();
  in_.open(files_[next_file_++], std::ios::in | std::ios::binary);
  return in_.is_open();
}

std::optional<LogRecord> ExportJournalSource::read_entry() {
  LogRecord record;
  bool has_fields = false;

  std::string line;
  while (std::getline(in_, line)) {
    if (line.empty()) {
      if (has_fields) {
        return record;
      }
      continue;
    }

    has_fields = true;
    const std::size_t eq = line.find('=');
    const std::string_view name = std::string_view(line).substr(0, eq);
    if (!is_valid_field_name(name)) {
      throw SourceReadError("malformed field name in " + files_[next_file_ - 1].string());
    }

    if (eq == std::string::npos) {
      assign_field(record, name, read_binary_value(line));
    } else {
      assign_field(record, name, line.substr(eq + 1));
    }
  }

  if (in_.bad()) {
    throw SourceReadError("I/O error while reading " + files_[next_file_ - 1].string());
  }

  if (has_fields) {
    return record;
  }
  return std::nullopt;
}

std::string ExportJournalSource::read_binary_value(const std::string& name) {
  const std::string file = files_[next_file_ - 1].string();

  char size_bytes[8];
  in_.read(size_bytes, sizeof(size_bytes));
  if (in_.gcount() != static_cast<std::streamsize>(sizeof(size_bytes))) {
    throw SourceReadError("truncated length of binary field " + name + " in " + file);
  }

  // Little-endian on the wire.
  std::uint64_t size = 0;
  for (int i = 7; i >= 0; --i) {
    size = (size << 8) | static_cast<unsigned char>(size_bytes[i]);
  }
  if (size > kMaxFieldSize) {
    throw SourceReadError("binary field " + name + " too large in " + file);
  }

  std::string value(static_cast<std::size_t>(size), '\0');
  in_.read(value.data(), static_cast<std::streamsize>(size));
  if (in_.gcount() != static_cast<std::streamsize>(size)) {
    throw SourceReadError("truncated binary field " + name + " in " + file);
  }

  char terminator = '\0';
  if (!in_.get(terminator) || terminator != '\n') {
    throw SourceReadError("binary field " + name + " is not newline-terminated in " + file);
  }

  return value;
}

}  // namespace journalstat
