#pragma once
#include "mbox_nav/error.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mn {

// Ordinal of a record in file order. Only meaningful for the reader that
// handed it out.
using Key = std::uint64_t;

// One record of an mbox archive: the "From " separator line followed by
// the RFC 822 message, byte-exact as stored in the file.
class MessageRecord {
public:
  MessageRecord() = default;
  MessageRecord(Key key, std::string raw) : key_(key), raw_(std::move(raw)) {}

  Key key() const noexcept { return key_; }
  const std::string& raw() const noexcept { return raw_; }

  // Separator line without its terminator.
  std::string_view from_line() const;

  // Everything after the separator line.
  std::string_view message() const;

private:
  Key key_{0};
  std::string raw_;
};

struct TocEntry {
  std::uint64_t offset = 0;
  std::uint64_t length = 0;
};

// Streaming reader. Keys are discovered lazily in file order while a
// table of contents (offset/length per record) is built alongside, so
// memory grows with the record count and never with the file size.
class ArchiveReader {
public:
  ArchiveReader();
  ~ArchiveReader();

  ArchiveReader(const ArchiveReader&) = delete;
  ArchiveReader& operator=(const ArchiveReader&) = delete;

  bool open(const std::string& path, Error* err = nullptr);
  void close() noexcept;
  bool is_open() const noexcept;

  // Next key in file order; nullopt once the file is exhausted or a read
  // fails (last_error() tells which). Not restartable without reopening.
  std::optional<Key> next_key();

  // Record for a key already handed out by next_key(). Unknown keys fail
  // with ErrorKind::NotFound.
  std::optional<MessageRecord> get(Key key, Error* err = nullptr);

  // Drains next_key() and returns the number of records in the file.
  std::size_t count();

  std::size_t keys_seen() const noexcept;
  const std::vector<TocEntry>& toc() const noexcept;
  const std::string& path() const noexcept;
  std::uint64_t file_size() const noexcept;
  const Error& last_error() const noexcept;

private:
  struct Impl; Impl* p_;
};

// Scoped exclusive advisory lock (flock) on an open descriptor. Never
// blocks: a file locked elsewhere leaves locked() false.
class FileLock {
public:
  explicit FileLock(int fd) noexcept;
  ~FileLock();

  FileLock(const FileLock&) = delete;
  FileLock& operator=(const FileLock&) = delete;

  bool locked() const noexcept { return locked_; }
  int error() const noexcept { return errno_; }
  void release() noexcept;

private:
  int fd_{-1};
  bool locked_{false};
  int errno_{0};
};

// Append-only mbox writer. Holds an exclusive lock on the file from
// open() until close() or destruction.
class ArchiveWriter {
public:
  enum class Mode { Truncate, Append };

  ArchiveWriter();
  ~ArchiveWriter();

  ArchiveWriter(const ArchiveWriter&) = delete;
  ArchiveWriter& operator=(const ArchiveWriter&) = delete;

  bool open(const std::string& path, Mode mode, Error* err = nullptr);

  // Writes a blank separator line when the file already holds data, then
  // the raw record, then a newline if the record lacks a trailing one.
  bool append(const MessageRecord& rec, Error* err = nullptr);
  bool append_raw(std::string_view raw, Error* err = nullptr);

  bool sync(Error* err = nullptr);
  void close() noexcept;

  bool is_open() const noexcept;
  bool is_locked() const noexcept;
  std::uint64_t records_written() const noexcept;
  std::uint64_t bytes_written() const noexcept;
  const std::string& path() const noexcept;

private:
  struct Impl; Impl* p_;
};

// True for a line starting with the mbox separator "From ".
bool is_from_line(std::string_view line) noexcept;

}
