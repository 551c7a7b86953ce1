#include "mbox_nav/chunk_reader.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

int main(){
  const fs::path f = "tests/data/sample.mbox";
  if (!fs::exists(f)) { std::cerr << "[ERR] missing: " << f << "\n"; return 2; }

  std::FILE* fp = std::fopen(f.string().c_str(), "rb");
  if (!fp) { std::cerr << "[ERR] cannot open " << f << "\n"; return 2; }

  // a tiny chunk forces lines to span refills
  mn::ChunkReader::Config cfg;
  cfg.chunk_bytes = 7;
  mn::ChunkReader r(fp, cfg);

  std::uint64_t bytes = 0, lines = 0, expect_off = 0;
  mn::ChunkReader::Line line;
  while (r.read_next(line)) {
    if (line.offset != expect_off) {
      std::cerr << "[FAIL] line " << lines << " offset " << line.offset << " != " << expect_off << "\n";
      std::fclose(fp); return 1;
    }
    expect_off += line.text.size();
    bytes += line.text.size();
    ++lines;
  }
  const std::uint64_t stat_size = fs::file_size(f);
  if (r.last_error() != 0) { std::cerr << "[FAIL] read error " << r.last_error() << "\n"; std::fclose(fp); return 1; }
  if (bytes != stat_size) { std::cerr << "[FAIL] bytes " << bytes << " != file_size " << stat_size << "\n"; std::fclose(fp); return 1; }
  if (lines < 10) { std::cerr << "[FAIL] expected many lines, got " << lines << "\n"; std::fclose(fp); return 1; }

  // seek back to the start and re-read the first line
  r.seek(0);
  if (!r.read_next(line) || line.offset != 0 || line.text.compare(0, 5, "From ") != 0) {
    std::cerr << "[FAIL] seek(0) did not restart at the first separator\n";
    std::fclose(fp); return 1;
  }

  // unterminated last line is still handed out
  const fs::path tmp = fs::temp_directory_path() / "mn_chunk_reader_tail.txt";
  { std::ofstream o(tmp, std::ios::binary); o << "a\r\nb"; }
  std::FILE* tp = std::fopen(tmp.string().c_str(), "rb");
  if (!tp) { std::fclose(fp); std::cerr << "[ERR] cannot open " << tmp << "\n"; return 2; }
  std::vector<std::string> got;
  {
    mn::ChunkReader tr(tp);
    while (tr.read_next(line)) got.emplace_back(line.text);
  }
  std::fclose(tp);
  fs::remove(tmp);
  std::fclose(fp);
  if (got.size() != 2 || got[0] != "a\r\n" || got[1] != "b") {
    std::cerr << "[FAIL] CRLF / unterminated tail not preserved\n";
    return 1;
  }

  std::cout << "[PASS] lines=" << lines << " bytes=" << bytes << " file_size=" << stat_size << "\n";
  return 0;
}
