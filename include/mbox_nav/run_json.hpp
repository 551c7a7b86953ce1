#pragma once
#include "mbox_nav/metrics.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mn {

// Outcome of one mbox-split run.
struct PartitionReport {
  std::string source;
  std::string output;
  std::string target_year;
  std::uint64_t total = 0;          // records in the source
  std::uint64_t scanned = 0;        // records visited before stop/end
  std::uint64_t matched = 0;
  std::uint64_t unclassified = 0;
  std::uint64_t bytes_written = 0;
  bool interrupted = false;
  std::string output_sha256;

  RunStats stats;                   // timings, throughput, decode fallbacks
};

// Mailbox overview served by `info`.
struct ArchiveStats {
  std::string path;
  std::uint64_t messages = 0;
  std::uint64_t file_bytes = 0;
  double size_mb = 0.0;
  std::optional<std::string> earliest;   // YYYY-MM-DD
  std::optional<std::string> latest;
  std::vector<std::pair<std::string, std::uint64_t>> top_domains;
  std::uint64_t undated = 0;
};

class RunJsonWriter {
public:
  static std::string to_json(const PartitionReport& r);
  static std::string to_json(const ArchiveStats& s);
};

}
