#include "mbox_nav/query.hpp"
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>

namespace mn {

PageResult page(const IndexTable& table, Cursor cursor, std::size_t n) {
  PageResult r;
  const std::size_t size = table.size();
  const std::size_t begin = std::min(cursor.pos, size);
  const std::size_t end = std::min(begin + n, size);
  r.rows = RowRange{begin, end};
  r.cursor.shown = begin;
  r.cursor.pos = (end < size) ? end : 0;
  return r;
}

Cursor page_backward(Cursor cursor, std::size_t n) {
  Cursor c = cursor;
  c.pos = (cursor.shown > n) ? cursor.shown - n : 0;
  return c;
}

std::optional<SortField> parse_sort_field(std::string_view name) {
  if (name == "from") return SortField::From;
  if (name == "date") return SortField::Date;
  if (name == "subject") return SortField::Subject;
  return std::nullopt;
}

const char* to_string(SortField f) noexcept {
  switch (f) {
    case SortField::From:    return "from";
    case SortField::Date:    return "date";
    case SortField::Subject: return "subject";
  }
  return "date";
}

void sort_table(IndexTable& table, SortField field, bool ascending) {
  auto by_text = [&](const std::string IndexRow::*member) {
    std::stable_sort(table.begin(), table.end(), [&](const IndexRow& a, const IndexRow& b) {
      int c = (a.*member).compare(b.*member);
      if (c == 0) return ascending ? a.key < b.key : b.key < a.key;
      return ascending ? c < 0 : c > 0;
    });
  };

  switch (field) {
    case SortField::From:    by_text(&IndexRow::from); break;
    case SortField::Subject: by_text(&IndexRow::subject); break;
    case SortField::Date:
      std::stable_sort(table.begin(), table.end(), [&](const IndexRow& a, const IndexRow& b) {
        if (a.date_sort.has_value() != b.date_sort.has_value()) return a.date_sort.has_value();
        if (!a.date_sort) return a.key < b.key;
        if (*a.date_sort != *b.date_sort)
          return ascending ? *a.date_sort < *b.date_sort : *a.date_sort > *b.date_sort;
        return ascending ? a.key < b.key : b.key < a.key;
      });
      break;
  }
}

// Lowercase mapping for two-byte UTF-8 letters: Latin-1, Latin Extended-A,
// Greek and Cyrillic. Anything else maps to itself.
static std::uint32_t lower_code_point(std::uint32_t cp) {
  if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) return cp + 0x20;
  if (cp >= 0x100 && cp <= 0x17F) {
    if (cp == 0x130 || cp == 0x131 || cp == 0x138 || cp == 0x149 || cp == 0x17F) return cp;
    if (cp == 0x178) return 0xFF;
    const bool odd_upper = (cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E);
    return ((cp & 1u) == (odd_upper ? 1u : 0u)) ? cp + 1 : cp;
  }
  if (cp == 0x386) return 0x3AC;
  if (cp >= 0x388 && cp <= 0x38A) return cp + 0x25;
  if (cp == 0x38C) return 0x3CC;
  if (cp == 0x38E || cp == 0x38F) return cp + 0x3F;
  if (cp >= 0x391 && cp <= 0x3A9 && cp != 0x3A2) return cp + 0x20;
  if (cp >= 0x400 && cp <= 0x40F) return cp + 0x50;
  if (cp >= 0x410 && cp <= 0x42F) return cp + 0x20;
  return cp;
}

// Case-folds ASCII and the two-byte letters above. Longer sequences and
// malformed bytes pass through unchanged.
static std::string utf8_lower(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    const auto c = static_cast<unsigned char>(s[i]);
    if (c < 0x80) {
      out.push_back(static_cast<char>(std::tolower(c)));
      continue;
    }
    if ((c & 0xE0) == 0xC0 && i + 1 < s.size() &&
        (static_cast<unsigned char>(s[i + 1]) & 0xC0) == 0x80) {
      std::uint32_t cp = ((c & 0x1Fu) << 6) | (static_cast<unsigned char>(s[i + 1]) & 0x3Fu);
      cp = lower_code_point(cp);
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
      ++i;
      continue;
    }
    out.push_back(s[i]);
  }
  return out;
}

std::optional<std::vector<std::size_t>> filter_positions(const IndexTable& table, std::string_view query) {
  while (!query.empty() && std::isspace(static_cast<unsigned char>(query.front()))) query.remove_prefix(1);
  while (!query.empty() && std::isspace(static_cast<unsigned char>(query.back()))) query.remove_suffix(1);
  if (query.empty()) return std::nullopt;

  const std::string q = utf8_lower(query);
  std::vector<std::size_t> hits;
  for (std::size_t i = 0; i < table.size(); ++i) {
    const IndexRow& row = table[i];
    if (utf8_lower(row.from).find(q) != std::string::npos ||
        utf8_lower(row.subject).find(q) != std::string::npos)
      hits.push_back(i);
  }
  return hits;
}

std::optional<IndexTable> filter_table(const IndexTable& table, std::string_view query) {
  auto hits = filter_positions(table, query);
  if (!hits) return std::nullopt;
  IndexTable out;
  out.reserve(hits->size());
  for (std::size_t i : *hits) out.push_back(table[i]);
  return out;
}

std::optional<MessageRecord> get_by_position(const IndexTable& table, ArchiveReader& reader,
                                             std::size_t idx, Error* err) {
  if (idx >= table.size()) {
    set_error(err, ErrorKind::OutOfRange, "Index out of range.");
    return std::nullopt;
  }
  return reader.get(table[idx].key, err);
}

}
