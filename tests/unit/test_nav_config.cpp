#include "mbox_nav/nav_config.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

namespace fs = std::filesystem;

static int failures = 0;

static void expect(bool cond, const std::string& what) {
  if (cond) return;
  std::cerr << "[FAIL] " << what << "\n";
  ++failures;
}

static fs::path write_tmp(const char* name, const std::string& body) {
  fs::path p = fs::temp_directory_path() / name;
  std::ofstream o(p, std::ios::binary);
  o << body;
  return p;
}

int main() {
  mn::Error err;

  mn::NavConfig shipped;
  expect(mn::load_nav_config("configs/navigator.json", shipped, &err), "shipped config loads: " + err.message);
  expect(shipped.page_size == 20 && shipped.columns.size() == 3 && shipped.wrap_width == 120, "shipped values");

  auto custom = write_tmp("mn_nav_custom.json",
      R"({"page_size": 5, "columns": ["subject", "nope", "to"], "theme": {"x": 1}, "search_limit": 7})");
  mn::NavConfig cfg;
  err.clear();
  expect(mn::load_nav_config(custom.string(), cfg, &err), "custom config loads: " + err.message);
  expect(cfg.page_size == 5 && cfg.search_limit == 7, "numbers applied");
  expect(cfg.columns.size() == 2 && cfg.columns[0] == mn::Column::Subject && cfg.columns[1] == mn::Column::To,
         "unknown column names dropped");
  expect(cfg.from_width == 30, "unset keys keep defaults");

  auto bad = write_tmp("mn_nav_bad.json", R"({"page_size": -3})");
  mn::NavConfig kept;
  kept.page_size = 11;
  err.clear();
  expect(!mn::load_nav_config(bad.string(), kept, &err) && err.kind == mn::ErrorKind::Usage, "negative size refused");
  expect(kept.page_size == 11, "config untouched on error");

  auto broken = write_tmp("mn_nav_broken.json", "{ not json");
  err.clear();
  expect(!mn::load_nav_config(broken.string(), kept, &err), "malformed file refused");
  err.clear();
  expect(!mn::load_nav_config("configs/missing.json", kept, &err) && err, "missing file refused");

  ::setenv("COLUMNS", "100", 1);
  expect(mn::terminal_width(120) == 100, "COLUMNS honoured");
  ::setenv("COLUMNS", "12", 1);
  expect(mn::terminal_width(120) == 120, "narrow COLUMNS ignored");
  ::unsetenv("COLUMNS");
  expect(mn::terminal_width(90) == 90, "fallback width");

  fs::remove(custom);
  fs::remove(bad);
  fs::remove(broken);
  if (failures) return 1;
  std::cout << "[PASS] navigator config\n";
  return 0;
}
