#include "mbox_nav/index.hpp"
#include "mbox_nav/date_parse.hpp"
#include "mbox_nav/headers.hpp"
#include "mbox_nav/interrupt.hpp"
#include "mbox_nav/metrics.hpp"
#include <iostream>

namespace mn {

IndexRow make_index_row(Key key, std::string_view message, MetricsRegistry* metrics) {
  HeaderSet h = read_headers(message, metrics);

  IndexRow row;
  row.key = key;
  row.from = std::move(h.from);
  row.subject = std::move(h.subject);
  row.to = std::move(h.to);
  row.date_sort = parse_mail_date(h.date);
  row.date_display = row.date_sort ? format_ymd(*row.date_sort) : std::move(h.date);
  return row;
}

std::optional<IndexTable> build_index(ArchiveReader& reader, MetricsRegistry* metrics, Error* err) {
  StageTimer timer(metrics, "index");
  IndexTable table;

  while (auto key = reader.next_key()) {
    if (interrupt_requested()) {
      set_error(err, ErrorKind::Interrupted, "index build interrupted");
      return std::nullopt;
    }
    Error get_err;
    auto rec = reader.get(*key, &get_err);
    if (!rec) {
      if (err) *err = get_err;
      return std::nullopt;
    }
    table.push_back(make_index_row(*key, rec->message(), metrics));
    if (metrics) { metrics->add_record(); metrics->add_bytes(rec->raw().size()); }
    if ((table.size() % 50000) == 0)
      std::cerr << "[index] " << table.size() << " messages...\n";
  }

  if (reader.last_error()) {
    if (err) *err = reader.last_error();
    return std::nullopt;
  }
  return table;
}

}
