#pragma once
#include "mbox_nav/archive.hpp"
#include "mbox_nav/error.hpp"
#include "mbox_nav/headers.hpp"
#include "mbox_nav/index.hpp"
#include "mbox_nav/metrics.hpp"
#include "mbox_nav/nav_config.hpp"
#include "mbox_nav/query.hpp"
#include "mbox_nav/run_json.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mn {

struct MessageView {
  HeaderSet headers;
  std::string body;
};

struct SearchResult {
  std::vector<std::size_t> positions;   // every match, table order
  std::size_t total = 0;
};

// State of one interactive session: the open archive, its index, the
// paging cursor and the display columns. Nothing here touches the
// archive file except reads.
class Session {
public:
  explicit Session(NavConfig cfg = NavConfig{});

  // Opens the archive and builds the index in one pass.
  bool open(const std::string& path, Error* err = nullptr);

  PageResult list(std::optional<std::size_t> n = std::nullopt);
  PageResult prev(std::optional<std::size_t> n = std::nullopt);

  // Comma separated subset of from,date,subject,to. Unknown names are
  // dropped; if nothing valid remains the columns stay unchanged and
  // false is returned.
  bool set_display_columns(std::string_view spec);

  std::optional<MessageView> show(std::size_t idx, Error* err = nullptr);
  std::optional<SearchResult> search(std::string_view text) const;
  bool save(std::size_t idx, const std::string& path, Error* err = nullptr);
  void sort(SortField field, bool ascending);
  ArchiveStats stats() const;
  std::string stats_json() const { return RunJsonWriter::to_json(stats()); }

  const IndexTable& table() const noexcept { return table_; }
  const Cursor& cursor() const noexcept { return cursor_; }
  const std::vector<Column>& columns() const noexcept { return cfg_.columns; }
  const NavConfig& config() const noexcept { return cfg_; }
  const MetricsRegistry& metrics() const noexcept { return metrics_; }
  const std::string& path() const noexcept { return reader_.path(); }

private:
  NavConfig cfg_;
  ArchiveReader reader_;
  IndexTable table_;
  Cursor cursor_;
  MetricsRegistry metrics_;
};

// "@domain" of the first address-like token in a From value.
std::optional<std::string> sender_domain(std::string_view from);

}
