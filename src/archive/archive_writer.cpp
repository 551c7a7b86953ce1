#include "mbox_nav/archive.hpp"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <memory>
#include <sys/file.h>
#include <unistd.h>

namespace mn {

FileLock::FileLock(int fd) noexcept : fd_(fd) {
  if (fd_ < 0) { errno_ = EBADF; return; }
  if (::flock(fd_, LOCK_EX | LOCK_NB) == 0) locked_ = true;
  else errno_ = errno;
}

FileLock::~FileLock() { release(); }

void FileLock::release() noexcept {
  if (locked_) { ::flock(fd_, LOCK_UN); locked_ = false; }
}

static bool write_all(int fd, const char* data, std::size_t n, int& err) {
  while (n > 0) {
    ssize_t w = ::write(fd, data, n);
    if (w < 0) {
      if (errno == EINTR) continue;
      err = errno;
      return false;
    }
    data += w;
    n -= static_cast<std::size_t>(w);
  }
  return true;
}

struct ArchiveWriter::Impl {
  std::string path;
  int fd{-1};
  std::unique_ptr<FileLock> lock;
  std::uint64_t size{0};        // bytes in the file
  bool ends_with_newline{true};
  std::uint64_t records{0};
  std::uint64_t written{0};     // bytes written by this writer

  bool put(std::string_view s, Error* err) {
    if (s.empty()) return true;
    int e = 0;
    if (!write_all(fd, s.data(), s.size(), e)) {
      set_error(err, ErrorKind::Io, "write failed: " + path + ": " + std::strerror(e));
      return false;
    }
    size += s.size();
    written += s.size();
    ends_with_newline = s.back() == '\n';
    return true;
  }
};

ArchiveWriter::ArchiveWriter() : p_(new Impl) {}
ArchiveWriter::~ArchiveWriter() { close(); delete p_; }

bool ArchiveWriter::open(const std::string& path, Mode mode, Error* err) {
  close();
  p_->path = path;
  p_->records = p_->written = 0;

  // O_TRUNC is deferred until the lock is held.
  p_->fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_CLOEXEC, 0644);
  if (p_->fd < 0) {
    set_error(err, ErrorKind::Io, "cannot open " + path + " for writing: " + std::strerror(errno));
    return false;
  }

  p_->lock.reset(new FileLock(p_->fd));
  if (!p_->lock->locked()) {
    int e = p_->lock->error();
    set_error(err, ErrorKind::Io, "cannot lock " + path + ": " +
              (e == EWOULDBLOCK ? std::string("locked by another process") : std::string(std::strerror(e))));
    close();
    return false;
  }

  if (mode == Mode::Truncate) {
    if (::ftruncate(p_->fd, 0) != 0) {
      set_error(err, ErrorKind::Io, "cannot truncate " + path + ": " + std::strerror(errno));
      close();
      return false;
    }
    p_->size = 0;
    p_->ends_with_newline = true;
  } else {
    off_t end = ::lseek(p_->fd, 0, SEEK_END);
    if (end < 0) {
      set_error(err, ErrorKind::Io, "cannot seek " + path + ": " + std::strerror(errno));
      close();
      return false;
    }
    p_->size = static_cast<std::uint64_t>(end);
    p_->ends_with_newline = true;
    if (end > 0) {
      char last = '\n';
      if (::pread(p_->fd, &last, 1, end - 1) == 1) p_->ends_with_newline = (last == '\n');
    }
  }
  if (::lseek(p_->fd, 0, SEEK_END) < 0) {
    set_error(err, ErrorKind::Io, "cannot seek " + path + ": " + std::strerror(errno));
    close();
    return false;
  }
  return true;
}

bool ArchiveWriter::append(const MessageRecord& rec, Error* err) {
  return append_raw(rec.raw(), err);
}

bool ArchiveWriter::append_raw(std::string_view raw, Error* err) {
  if (p_->fd < 0) { set_error(err, ErrorKind::Io, "archive writer is not open"); return false; }

  if (p_->size > 0) {
    if (!p_->ends_with_newline && !p_->put("\n", err)) return false;
    if (!p_->put("\n", err)) return false;
  }
  if (!p_->put(raw, err)) return false;
  if (!p_->ends_with_newline && !p_->put("\n", err)) return false;
  ++p_->records;
  return true;
}

bool ArchiveWriter::sync(Error* err) {
  if (p_->fd < 0) return true;
  if (::fsync(p_->fd) != 0) {
    set_error(err, ErrorKind::Io, "fsync failed: " + p_->path + ": " + std::strerror(errno));
    return false;
  }
  return true;
}

void ArchiveWriter::close() noexcept {
  p_->lock.reset();
  if (p_->fd >= 0) { ::close(p_->fd); p_->fd = -1; }
}

bool ArchiveWriter::is_open() const noexcept { return p_->fd >= 0; }
bool ArchiveWriter::is_locked() const noexcept { return p_->lock && p_->lock->locked(); }
std::uint64_t ArchiveWriter::records_written() const noexcept { return p_->records; }
std::uint64_t ArchiveWriter::bytes_written() const noexcept { return p_->written; }
const std::string& ArchiveWriter::path() const noexcept { return p_->path; }

}
