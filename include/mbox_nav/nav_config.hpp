#pragma once
#include "mbox_nav/error.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace mn {

enum class Column { From, Date, Subject, To };

// Navigator defaults; overridden by --config=<file.json> and flags.
struct NavConfig {
  std::size_t page_size = 20;
  std::vector<Column> columns = {Column::Date, Column::From, Column::Subject};
  std::size_t from_width = 30;
  std::size_t wrap_width = 120;     // terminal width for rules and wrapping
  std::size_t search_limit = 100;   // rows displayed per search
};

bool parse_column(const std::string& name, Column& out);
const char* to_string(Column c) noexcept;

// Reads a JSON object with any of: page_size, columns, from_width,
// wrap_width, search_limit. Unknown keys are ignored. On a malformed file
// `cfg` is left untouched and false is returned.
bool load_nav_config(const std::string& path, NavConfig& cfg, Error* err = nullptr);

// Terminal width from $COLUMNS, else `fallback`.
std::size_t terminal_width(std::size_t fallback = 120);

}
