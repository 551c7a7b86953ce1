#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <string_view>

namespace mn {

// Pull-based line reader over an already open FILE*. Lines keep their
// terminator ("\n" or "\r\n") so offsets and lengths add up to the file.
// The reader re-seeks before every refill, so other users of the same
// handle may fseek between calls.
class ChunkReader {
public:
  struct Config {
    std::size_t chunk_bytes = 512 * 1024;      // 512 KiB
  };

  struct Line {
    std::string_view text;     // valid until the next read_next()/seek()
    std::uint64_t offset = 0;  // absolute offset of text[0]
  };

  explicit ChunkReader(std::FILE* f);          // uses default Config{}
  ChunkReader(std::FILE* f, Config cfg);
  ~ChunkReader();

  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  // False at end of file or on a read error (see last_error()).
  bool read_next(Line& out);

  // Restart reading at an absolute offset.
  void seek(std::uint64_t offset);

  // Offset of the first byte not yet handed out.
  std::uint64_t position() const noexcept;

  int  last_error() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
