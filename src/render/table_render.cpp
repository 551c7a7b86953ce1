#include "mbox_nav/table_render.hpp"
#include <algorithm>
#include <sstream>

namespace mn {

std::size_t display_width(std::string_view s) noexcept {
  std::size_t n = 0;
  for (unsigned char c : s) if ((c & 0xC0) != 0x80) ++n;
  return n;
}

std::string truncate_display(std::string_view s, std::size_t width) {
  std::size_t points = 0;
  for (std::size_t i = 0; i < s.size(); ++i) {
    if ((static_cast<unsigned char>(s[i]) & 0xC0) != 0x80) {
      if (points == width) return std::string(s.substr(0, i));
      ++points;
    }
  }
  return std::string(s);
}

const std::string& column_value(const IndexRow& row, Column c) {
  switch (c) {
    case Column::From:    return row.from;
    case Column::Date:    return row.date_display;
    case Column::Subject: return row.subject;
    case Column::To:      return row.to;
  }
  return row.date_display;
}

// Control characters would break the box layout.
static std::string flatten(std::string_view s) {
  std::string out(s);
  for (auto& c : out) if (static_cast<unsigned char>(c) < 0x20) c = ' ';
  return out;
}

std::string render_table(const IndexTable& table,
                         const std::vector<std::size_t>& positions,
                         const std::vector<Column>& columns,
                         const TableStyle& style) {
  const std::size_t ncols = columns.size() + 1;
  std::vector<std::string> header{""};
  for (Column c : columns) header.emplace_back(to_string(c));

  std::vector<std::vector<std::string>> cells;
  cells.reserve(positions.size());
  for (std::size_t pos : positions) {
    if (pos >= table.size()) continue;
    std::vector<std::string> line{std::to_string(pos)};
    for (Column c : columns) {
      std::string v = flatten(column_value(table[pos], c));
      if (c == Column::From) v = truncate_display(v, style.from_width);
      if (c == Column::Subject) v = truncate_display(v, style.subject_width);
      line.push_back(std::move(v));
    }
    cells.push_back(std::move(line));
  }

  std::vector<std::size_t> width(ncols, 0);
  for (std::size_t i = 0; i < ncols; ++i) width[i] = display_width(header[i]);
  for (auto& line : cells)
    for (std::size_t i = 0; i < ncols; ++i) width[i] = std::max(width[i], display_width(line[i]));

  std::ostringstream o;
  auto rule = [&](char edge, char mid) {
    o << edge;
    for (std::size_t i = 0; i < ncols; ++i) {
      o << std::string(width[i] + 2, '-');
      o << (i + 1 < ncols ? mid : edge);
    }
    o << '\n';
  };
  auto row = [&](const std::vector<std::string>& v, bool right_align_first) {
    o << '|';
    for (std::size_t i = 0; i < ncols; ++i) {
      const std::size_t pad = width[i] - display_width(v[i]);
      o << ' ';
      if (i == 0 && right_align_first) o << std::string(pad, ' ') << v[i];
      else o << v[i] << std::string(pad, ' ');
      o << " |";
    }
    o << '\n';
  };

  rule('+', '+');
  row(header, false);
  rule('|', '+');
  for (auto& line : cells) row(line, true);
  rule('+', '+');
  return o.str();
}

}
