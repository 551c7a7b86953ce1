#include "mbox_nav/archive.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int failures = 0;

static void expect(bool cond, const std::string& what) {
  if (cond) return;
  std::cerr << "[FAIL] " << what << "\n";
  ++failures;
}

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

int main() {
  const fs::path sample = "tests/data/sample.mbox";
  if (!fs::exists(sample)) { std::cerr << "[ERR] missing: " << sample << "\n"; return 2; }

  mn::ArchiveReader reader;
  mn::Error err;
  if (!reader.open(sample.string(), &err)) { std::cerr << "[ERR] " << err.message << "\n"; return 2; }

  // keys are handed out lazily, in file order
  auto k0 = reader.next_key();
  expect(k0 && *k0 == 0, "first key is 0");
  expect(reader.keys_seen() == 1, "only one key discovered after one next_key()");

  err.clear();
  expect(!reader.get(3, &err) && err.kind == mn::ErrorKind::NotFound, "unseen key is NotFound");

  auto r0 = reader.get(0, &err);
  expect(r0.has_value(), "get(0)");
  if (r0) {
    expect(r0->from_line() == "From alice@example.com Tue Mar 15 10:00:00 2022", "from_line of record 0");
    expect(r0->message().compare(0, 6, "From: ") == 0, "message() starts with the header block");
    const std::string& raw = r0->raw();
    const std::string tail = "report\n\nNumbers attached.\n";
    expect(raw.size() >= tail.size() && raw.compare(raw.size() - tail.size(), tail.size(), tail) == 0,
           "separator blank line excluded from record");
  }

  expect(reader.count() == 5, "count() drains the rest of the file");
  expect(!reader.next_key(), "no keys after the end");
  expect(!reader.last_error(), "no read error");

  std::uint64_t covered = 0;
  for (const auto& e : reader.toc()) covered += e.length;
  // five records, four blank separators between them
  expect(covered + 4 == reader.file_size(), "toc covers the file except separators");

  auto r2 = reader.get(2, &err);
  expect(r2 && r2->raw().find(">From the desk") != std::string::npos, "escaped From line stays in the body");
  err.clear();
  expect(!reader.get(99, &err) && err.kind == mn::ErrorKind::NotFound, "unknown key is NotFound");

  // missing file
  mn::ArchiveReader missing;
  err.clear();
  expect(!missing.open("tests/data/does-not-exist.mbox", &err) && err.kind == mn::ErrorKind::Io,
         "missing file is an Io error");

  // writer: truncate, append, lock
  const fs::path out = fs::temp_directory_path() / "mn_archive_writer.mbox";
  {
    mn::ArchiveWriter w;
    err.clear();
    expect(w.open(out.string(), mn::ArchiveWriter::Mode::Truncate, &err), "writer open: " + err.message);
    expect(w.is_locked(), "writer holds the lock");

    mn::ArchiveWriter second;
    err.clear();
    expect(!second.open(out.string(), mn::ArchiveWriter::Mode::Append, &err) && err.kind == mn::ErrorKind::Io,
           "second writer refused while locked");

    expect(r0 && w.append(*r0, &err), "append record 0");
    expect(w.append_raw("From x Thu Jan  1 00:00:00 1970\nSubject: no newline", &err), "append unterminated");
    expect(w.records_written() == 2, "two records written");
  }
  {
    mn::ArchiveWriter w;
    err.clear();
    expect(w.open(out.string(), mn::ArchiveWriter::Mode::Append, &err), "reopen after close: " + err.message);
    expect(r2 && w.append(*r2, &err), "append record 2");
  }

  mn::ArchiveReader back;
  expect(back.open(out.string(), &err), "reopen written archive");
  expect(back.count() == 3, "written archive has three records");
  auto b0 = back.get(0, &err);
  auto b1 = back.get(1, &err);
  auto b2 = back.get(2, &err);
  expect(b0 && r0 && b0->raw() == r0->raw(), "record 0 byte-identical after round trip");
  expect(b1 && b1->raw() == "From x Thu Jan  1 00:00:00 1970\nSubject: no newline\n", "missing newline added");
  expect(b2 && r2 && b2->raw() == r2->raw(), "record 2 byte-identical after append");
  expect(slurp(out).find("\n\nFrom x ") != std::string::npos, "blank separator line written");
  back.close();
  fs::remove(out);

  if (failures) return 1;
  std::cout << "[PASS] archive reader/writer\n";
  return 0;
}
