#pragma once
#include "mbox_nav/archive.hpp"
#include "mbox_nav/error.hpp"
#include "mbox_nav/index.hpp"
#include <cstddef>
#include <optional>
#include <string_view>
#include <vector>

namespace mn {

// Paging position. `pos` is where the next page starts; `shown` is where
// the last page handed out started, so "previous page" stays correct
// after the cursor wrapped to 0.
struct Cursor {
  std::size_t pos = 0;
  std::size_t shown = 0;
};

// Half-open range of table positions.
struct RowRange {
  std::size_t begin = 0;
  std::size_t end = 0;
  std::size_t size() const noexcept { return end - begin; }
  bool empty() const noexcept { return begin == end; }
};

struct PageResult {
  RowRange rows;
  Cursor cursor;   // advanced; back at 0 once the end was reached
};

PageResult page(const IndexTable& table, Cursor cursor, std::size_t n);

// Cursor for the page before the one last shown; page() it forward by n.
Cursor page_backward(Cursor cursor, std::size_t n);

enum class SortField { From, Date, Subject };

std::optional<SortField> parse_sort_field(std::string_view name);
const char* to_string(SortField f) noexcept;

// Total reorder. Ties fall back to archive order, so descending is the
// exact mirror of ascending. For Date, rows without a parsed date go last
// in both directions, in archive order.
void sort_table(IndexTable& table, SortField field, bool ascending);

// Case-insensitive substring match on `from` or `subject`. Positions keep
// the table's current order. A blank query is refused (nullopt).
std::optional<std::vector<std::size_t>> filter_positions(const IndexTable& table, std::string_view query);
std::optional<IndexTable> filter_table(const IndexTable& table, std::string_view query);

// Resolves the row at `idx` through the reader. OutOfRange for a bad
// position, NotFound/Io from the reader otherwise.
std::optional<MessageRecord> get_by_position(const IndexTable& table, ArchiveReader& reader,
                                             std::size_t idx, Error* err = nullptr);

}
