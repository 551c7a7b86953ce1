#include "mbox_nav/nav_config.hpp"
#include "mbox_nav/parse_policy.hpp"
#include <cstdlib>
#include <simdjson.h>

namespace mn {

bool parse_column(const std::string& name, Column& out) {
  if (name == "from")    { out = Column::From;    return true; }
  if (name == "date")    { out = Column::Date;    return true; }
  if (name == "subject") { out = Column::Subject; return true; }
  if (name == "to")      { out = Column::To;      return true; }
  return false;
}

const char* to_string(Column c) noexcept {
  switch (c) {
    case Column::From:    return "from";
    case Column::Date:    return "date";
    case Column::Subject: return "subject";
    case Column::To:      return "to";
  }
  return "date";
}

static bool fail(Error* err, const std::string& path, const std::string& what) {
  set_error(err, ErrorKind::Usage, "config " + path + ": " + what);
  return false;
}

bool load_nav_config(const std::string& path, NavConfig& cfg, Error* err) {
  simdjson::padded_string json;
  if (auto e = simdjson::padded_string::load(path).get(json); e)
    return fail(err, path, simdjson::error_message(e));

  simdjson::ondemand::parser parser;
  simdjson::ondemand::document doc;
  if (auto e = parser.iterate(json).get(doc); e) return fail(err, path, simdjson::error_message(e));

  simdjson::ondemand::object obj;
  if (auto e = doc.get_object().get(obj); e) return fail(err, path, simdjson::error_message(e));

  NavConfig next = cfg;
  for (auto field : obj) {
    std::string_view key;
    if (auto e = field.unescaped_key().get(key); e) return fail(err, path, simdjson::error_message(e));

    auto read_size = [&](std::size_t& out) -> bool {
      std::uint64_t v = 0;
      if (field.value().get_uint64().get(v) != simdjson::SUCCESS)
        return fail(err, path, std::string(key) + " must be a non-negative integer");
      out = static_cast<std::size_t>(v);
      return true;
    };

    if (key == "page_size") {
      if (!read_size(next.page_size)) return false;
    } else if (key == "from_width") {
      if (!read_size(next.from_width)) return false;
    } else if (key == "wrap_width") {
      if (!read_size(next.wrap_width)) return false;
    } else if (key == "search_limit") {
      if (!read_size(next.search_limit)) return false;
    } else if (key == "columns") {
      simdjson::ondemand::array arr;
      if (field.value().get_array().get(arr) != simdjson::SUCCESS)
        return fail(err, path, "columns must be an array of strings");
      std::vector<Column> cols;
      for (auto el : arr) {
        std::string_view name;
        if (el.get_string().get(name) != simdjson::SUCCESS)
          return fail(err, path, "columns must be an array of strings");
        Column c;
        if (parse_column(std::string(name), c)) cols.push_back(c);
      }
      if (cols.empty()) return fail(err, path, "columns names no known column");
      next.columns = std::move(cols);
    }
  }
  if (next.page_size == 0) return fail(err, path, "page_size must be positive");
  cfg = std::move(next);
  return true;
}

std::size_t terminal_width(std::size_t fallback) {
  const char* v = std::getenv("COLUMNS");
  if (!v || !*v) return fallback;
  auto n = parse_count(v);
  return (n && *n >= 40) ? *n : fallback;
}

}
