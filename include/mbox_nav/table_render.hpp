#pragma once
#include "mbox_nav/index.hpp"
#include "mbox_nav/nav_config.hpp"
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace mn {

struct TableStyle {
  std::size_t from_width = 30;
  std::size_t subject_width = 60;
};

// psql-style box table of the given table positions, first column being
// the position itself.
std::string render_table(const IndexTable& table,
                         const std::vector<std::size_t>& positions,
                         const std::vector<Column>& columns,
                         const TableStyle& style);

// Cell text of a row for a column.
const std::string& column_value(const IndexRow& row, Column c);

// Display width in code points (UTF-8 continuation bytes not counted).
std::size_t display_width(std::string_view s) noexcept;

// Cut to at most `width` code points.
std::string truncate_display(std::string_view s, std::size_t width);

}
