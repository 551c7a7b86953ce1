#pragma once
#include "mbox_nav/archive.hpp"
#include "mbox_nav/error.hpp"
#include "mbox_nav/run_json.hpp"
#include "mbox_nav/year_classifier.hpp"
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace mn {

class MetricsRegistry;

struct PartitionOptions {
  bool debug = false;
  std::ostream* log = nullptr;   // debug traces; nothing printed when null
};

struct PartitionCounts {
  std::uint64_t scanned = 0;
  std::uint64_t matched = 0;
  std::uint64_t unclassified = 0;
  bool interrupted = false;
};

// Year of one record's Date header, nullopt when absent or unclassifiable.
YearMatch classify_record(std::string_view message, MetricsRegistry* metrics = nullptr);

// Streams the reader's remaining keys in file order and appends the raw
// bytes of every record whose Date classifies to `target_year`.
// Unclassifiable dates are skipped silently. Stops early (counts.interrupted)
// on SIGINT. nullopt on an I/O error.
std::optional<PartitionCounts> partition(ArchiveReader& reader, ArchiveWriter& writer,
                                         std::string_view target_year,
                                         const PartitionOptions& opt = PartitionOptions{},
                                         MetricsRegistry* metrics = nullptr,
                                         Error* err = nullptr);

// Dry run: prints the classification of the first `count` records.
std::size_t sample_classification(ArchiveReader& reader, std::size_t count, std::ostream& out);

struct SplitJob {
  std::string source;
  std::string year;
  std::string output;
  std::size_t sample_count = 0;   // > 0: report only, output untouched
  bool debug = false;
};

// Whole batch run: truncates `output`, partitions, fingerprints the
// result. Progress lines go to `out`.
std::optional<PartitionReport> partition_file(const SplitJob& job, std::ostream& out, Error* err = nullptr);

}
