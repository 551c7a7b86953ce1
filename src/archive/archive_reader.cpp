#include "mbox_nav/archive.hpp"
#include "mbox_nav/chunk_reader.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <sys/stat.h>
#include <sys/types.h>

namespace mn {

bool is_from_line(std::string_view line) noexcept {
  return line.size() >= 5 && line.compare(0, 5, "From ") == 0;
}

static bool is_blank_line(std::string_view line) noexcept {
  return line == "\n" || line == "\r\n";
}

static std::string_view strip_eol(std::string_view s) {
  if (!s.empty() && s.back() == '\n') s.remove_suffix(1);
  if (!s.empty() && s.back() == '\r') s.remove_suffix(1);
  return s;
}

std::string_view MessageRecord::from_line() const {
  std::string_view r(raw_);
  auto nl = r.find('\n');
  return strip_eol(nl == std::string_view::npos ? r : r.substr(0, nl + 1));
}

std::string_view MessageRecord::message() const {
  std::string_view r(raw_);
  if (!is_from_line(r)) return r;
  auto nl = r.find('\n');
  return nl == std::string_view::npos ? std::string_view{} : r.substr(nl + 1);
}

struct ArchiveReader::Impl {
  std::string path;
  std::FILE* f{nullptr};
  std::unique_ptr<ChunkReader> lines;
  std::uint64_t size{0};
  std::vector<TocEntry> toc;
  Error err;

  // scan state
  std::optional<std::uint64_t> pending_start;  // record whose end is unknown
  std::uint64_t last_line_offset{0};
  bool last_was_blank{false};
  bool done{false};

  void reset_scan() {
    toc.clear();
    pending_start.reset();
    last_line_offset = 0;
    last_was_blank = false;
    done = false;
    err.clear();
  }

  // A record ends before the next separator, minus one blank line that
  // only serves as separation.
  Key close_pending(std::uint64_t boundary) {
    std::uint64_t stop = last_was_blank ? last_line_offset : boundary;
    toc.push_back(TocEntry{*pending_start, stop - *pending_start});
    pending_start.reset();
    return static_cast<Key>(toc.size() - 1);
  }

  std::optional<Key> next_key() {
    if (done || !lines) return std::nullopt;

    ChunkReader::Line line;
    while (lines->read_next(line)) {
      if (is_from_line(line.text)) {
        std::optional<Key> finished;
        if (pending_start) finished = close_pending(line.offset);
        pending_start = line.offset;
        last_was_blank = false;
        last_line_offset = line.offset;
        if (finished) return finished;
        continue;
      }
      last_was_blank = is_blank_line(line.text);
      last_line_offset = line.offset;
    }

    done = true;
    if (lines->last_error() != 0) {
      err.kind = ErrorKind::Io;
      err.message = "read failed: " + path + ": " + std::strerror(lines->last_error());
      return std::nullopt;
    }
    if (pending_start) return close_pending(lines->position());
    return std::nullopt;
  }
};

ArchiveReader::ArchiveReader() : p_(new Impl) {}
ArchiveReader::~ArchiveReader() { close(); delete p_; }

bool ArchiveReader::open(const std::string& path, Error* err) {
  close();
  p_->reset_scan();
  p_->path = path;

  struct stat st{};
  if (::stat(path.c_str(), &st) != 0) {
    p_->err = Error{ErrorKind::Io, "cannot stat " + path + ": " + std::strerror(errno)};
    if (err) *err = p_->err;
    return false;
  }
  if (S_ISDIR(st.st_mode)) {
    p_->err = Error{ErrorKind::Io, path + " is a directory"};
    if (err) *err = p_->err;
    return false;
  }

  p_->f = std::fopen(path.c_str(), "rb");
  if (!p_->f) {
    p_->err = Error{ErrorKind::Io, "cannot open " + path + ": " + std::strerror(errno)};
    if (err) *err = p_->err;
    return false;
  }
  p_->size = static_cast<std::uint64_t>(st.st_size);
  p_->lines.reset(new ChunkReader(p_->f));
  return true;
}

void ArchiveReader::close() noexcept {
  p_->lines.reset();
  if (p_->f) { std::fclose(p_->f); p_->f = nullptr; }
}

bool ArchiveReader::is_open() const noexcept { return p_->f != nullptr; }

std::optional<Key> ArchiveReader::next_key() { return p_->next_key(); }

std::optional<MessageRecord> ArchiveReader::get(Key key, Error* err) {
  if (key >= p_->toc.size()) {
    set_error(err, ErrorKind::NotFound, "no record with key " + std::to_string(key));
    return std::nullopt;
  }
  if (!p_->f) {
    set_error(err, ErrorKind::Io, "archive is not open");
    return std::nullopt;
  }

  const TocEntry& e = p_->toc[static_cast<std::size_t>(key)];
  std::string raw(static_cast<std::size_t>(e.length), '\0');
  if (::fseeko(p_->f, static_cast<off_t>(e.offset), SEEK_SET) != 0) {
    set_error(err, ErrorKind::Io, "seek failed: " + p_->path + ": " + std::strerror(errno));
    return std::nullopt;
  }
  std::size_t n = raw.empty() ? 0 : std::fread(&raw[0], 1, raw.size(), p_->f);
  if (n != raw.size()) {
    int e2 = std::ferror(p_->f) ? errno : 0;
    std::clearerr(p_->f);
    set_error(err, ErrorKind::Io, "short read on " + p_->path +
              (e2 ? std::string(": ") + std::strerror(e2) : std::string(" (file truncated?)")));
    return std::nullopt;
  }
  return MessageRecord(key, std::move(raw));
}

std::size_t ArchiveReader::count() {
  while (p_->next_key()) {}
  return p_->toc.size();
}

std::size_t ArchiveReader::keys_seen() const noexcept { return p_->toc.size(); }
const std::vector<TocEntry>& ArchiveReader::toc() const noexcept { return p_->toc; }
const std::string& ArchiveReader::path() const noexcept { return p_->path; }
std::uint64_t ArchiveReader::file_size() const noexcept { return p_->size; }
const Error& ArchiveReader::last_error() const noexcept { return p_->err; }

}
