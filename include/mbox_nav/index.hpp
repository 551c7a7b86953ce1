#pragma once
#include "mbox_nav/archive.hpp"
#include "mbox_nav/error.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mn {

class MetricsRegistry;

// Summary of one message. Raw bytes stay in the archive.
struct IndexRow {
  Key key = 0;
  std::string from;
  std::string date_display;               // YYYY-MM-DD, or the raw header
  std::optional<std::int64_t> date_sort;  // epoch seconds when the date parsed
  std::string subject;
  std::string to;
};

// Rows in archive order after build; sorting reorders them in place.
using IndexTable = std::vector<IndexRow>;

IndexRow make_index_row(Key key, std::string_view message, MetricsRegistry* metrics = nullptr);

// One pass over the reader's remaining keys. Records that decode badly
// still get a row. nullopt on an I/O error or when interrupted.
std::optional<IndexTable> build_index(ArchiveReader& reader,
                                      MetricsRegistry* metrics = nullptr,
                                      Error* err = nullptr);

}
