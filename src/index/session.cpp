#include "mbox_nav/session.hpp"
#include "mbox_nav/date_parse.hpp"
#include "mbox_nav/message_body.hpp"
#include "mbox_nav/path_utils.hpp"
#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>

namespace mn {

Session::Session(NavConfig cfg) : cfg_(std::move(cfg)) {
  if (cfg_.page_size == 0) cfg_.page_size = 20;
}

bool Session::open(const std::string& path, Error* err) {
  table_.clear();
  cursor_ = Cursor{};
  metrics_.reset();
  if (!reader_.open(path, err)) return false;

  std::cerr << "[index] Indexing " << path << " (this may take a minute on very large files)\n";
  auto built = build_index(reader_, &metrics_, err);
  if (!built) return false;
  table_ = std::move(*built);
  std::cerr << "[index] Loaded " << table_.size() << " messages from " << path << "\n";
  return true;
}

PageResult Session::list(std::optional<std::size_t> n) {
  PageResult r = page(table_, cursor_, n.value_or(cfg_.page_size));
  cursor_ = r.cursor;
  return r;
}

PageResult Session::prev(std::optional<std::size_t> n) {
  const std::size_t step = n.value_or(cfg_.page_size);
  cursor_ = page_backward(cursor_, step);
  return list(step);
}

bool Session::set_display_columns(std::string_view spec) {
  std::vector<Column> cols;
  std::size_t pos = 0;
  while (pos <= spec.size()) {
    std::size_t comma = spec.find(',', pos);
    std::string_view item = spec.substr(pos, (comma == std::string_view::npos ? spec.size() : comma) - pos);
    while (!item.empty() && std::isspace(static_cast<unsigned char>(item.front()))) item.remove_prefix(1);
    while (!item.empty() && std::isspace(static_cast<unsigned char>(item.back()))) item.remove_suffix(1);
    Column c;
    if (parse_column(std::string(item), c)) cols.push_back(c);
    if (comma == std::string_view::npos) break;
    pos = comma + 1;
  }
  if (cols.empty()) return false;
  cfg_.columns = std::move(cols);
  return true;
}

std::optional<MessageView> Session::show(std::size_t idx, Error* err) {
  auto rec = get_by_position(table_, reader_, idx, err);
  if (!rec) return std::nullopt;
  MessageView v;
  v.headers = read_headers(rec->message());
  v.body = extract_plain_body(rec->message());
  return v;
}

std::optional<SearchResult> Session::search(std::string_view text) const {
  auto hits = filter_positions(table_, text);
  if (!hits) return std::nullopt;
  SearchResult r;
  r.total = hits->size();
  r.positions = std::move(*hits);
  return r;
}

bool Session::save(std::size_t idx, const std::string& path, Error* err) {
  auto rec = get_by_position(table_, reader_, idx, err);
  if (!rec) return false;
  return write_file(path, rec->message(), err);
}

void Session::sort(SortField field, bool ascending) {
  sort_table(table_, field, ascending);
  cursor_ = Cursor{};
}

std::optional<std::string> sender_domain(std::string_view from) {
  auto at = from.find('@');
  if (at == std::string_view::npos) return std::nullopt;
  std::size_t end = at + 1;
  while (end < from.size()) {
    unsigned char c = static_cast<unsigned char>(from[end]);
    if (!(std::isalnum(c) || c == '_' || c == '.' || c == '-')) break;
    ++end;
  }
  if (end == at + 1) return std::nullopt;
  return std::string(from.substr(at + 1, end - at - 1));
}

ArchiveStats Session::stats() const {
  ArchiveStats s;
  s.path = reader_.path();
  s.messages = table_.size();
  s.file_bytes = reader_.file_size();
  s.size_mb = s.file_bytes / (1024.0 * 1024.0);

  std::optional<std::int64_t> lo, hi;
  std::map<std::string, std::uint64_t> domains;
  for (const auto& row : table_) {
    if (row.date_sort) {
      if (!lo || *row.date_sort < *lo) lo = row.date_sort;
      if (!hi || *row.date_sort > *hi) hi = row.date_sort;
    } else {
      ++s.undated;
    }
    if (auto d = sender_domain(row.from)) ++domains[*d];
  }
  if (lo) s.earliest = format_ymd(*lo);
  if (hi) s.latest = format_ymd(*hi);

  std::vector<std::pair<std::string, std::uint64_t>> ranked(domains.begin(), domains.end());
  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const auto& a, const auto& b) { return a.second > b.second; });
  if (ranked.size() > 5) ranked.resize(5);
  s.top_domains = std::move(ranked);
  return s;
}

}
