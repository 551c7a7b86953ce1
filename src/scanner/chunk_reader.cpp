#include "mbox_nav/chunk_reader.hpp"
#include <cerrno>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

namespace mn {

struct ChunkReader::Impl {
  std::FILE* f;
  Config cfg;
  std::vector<char> buf;
  std::size_t head{0}, tail{0};   // unread window of buf
  std::uint64_t buf_base{0};      // file offset of buf[0]
  std::uint64_t next_fill{0};     // file offset of the next fread
  std::string carry;              // line spanning two or more chunks
  int last_errno{0};

  Impl(std::FILE* file, Config c) : f(file), cfg(c), buf(c.chunk_bytes ? c.chunk_bytes : 1) {}

  bool fill() {
    if (!f) return false;
    if (::fseeko(f, static_cast<off_t>(next_fill), SEEK_SET) != 0) { last_errno = errno; return false; }
    std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
    if (n == 0) {
      if (std::ferror(f)) { last_errno = errno ? errno : EIO; std::clearerr(f); }
      return false;
    }
    buf_base = next_fill;
    head = 0; tail = n;
    next_fill += n;
    return true;
  }

  bool read_next(Line& out) {
    carry.clear();
    bool started = false;
    std::uint64_t start_off = 0;

    while (true) {
      if (head == tail && !fill()) {
        // end of file (or error): emit an unterminated last line if any
        if (carry.empty()) return false;
        out.text = carry;
        out.offset = start_off;
        return true;
      }
      if (!started) { start_off = buf_base + head; started = true; }

      std::string_view block(buf.data() + head, tail - head);
      std::size_t pos = block.find('\n');
      if (pos == std::string_view::npos) {
        carry.append(block);
        head = tail;
        continue;
      }

      std::string_view slice = block.substr(0, pos + 1);
      head += pos + 1;
      if (carry.empty()) {
        out.text = slice;
      } else {
        carry.append(slice);
        out.text = carry;
      }
      out.offset = start_off;
      return true;
    }
  }
};

ChunkReader::ChunkReader(std::FILE* f)
  : ChunkReader(f, Config{}) {}

ChunkReader::ChunkReader(std::FILE* f, Config cfg)
  : p_(new Impl(f, cfg)) {}

ChunkReader::~ChunkReader() { delete p_; }

bool ChunkReader::read_next(Line& out) { return p_->read_next(out); }

void ChunkReader::seek(std::uint64_t offset) {
  p_->next_fill = offset;
  p_->buf_base = offset;
  p_->head = p_->tail = 0;
  p_->carry.clear();
}

std::uint64_t ChunkReader::position() const noexcept { return p_->buf_base + p_->head; }
int  ChunkReader::last_error() const noexcept { return p_->last_errno; }

}
