#include "mbox_nav/commands.hpp"
#include "mbox_nav/mustache_renderer.hpp"
#include "mbox_nav/session.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <simdjson.h>

namespace fs = std::filesystem;

static int failures = 0;

static void expect(bool cond, const std::string& what) {
  if (cond) return;
  std::cerr << "[FAIL] " << what << "\n";
  ++failures;
}

static bool has(const std::string& hay, const std::string& needle) {
  return hay.find(needle) != std::string::npos;
}

int main() {
  const fs::path sample = "tests/data/sample.mbox";
  if (!fs::exists(sample)) { std::cerr << "[ERR] missing: " << sample << "\n"; return 2; }

  mn::Session session;
  mn::Error err;
  if (!session.open(sample.string(), &err)) { std::cerr << "[ERR] " << err.message << "\n"; return 2; }
  expect(session.table().size() == 5, "five messages indexed");

  mn::MustacheRenderer renderer(mn::MustacheRenderer::Config{"templates"});
  std::ostringstream out;
  mn::Navigator nav(session, out, renderer);
  nav.set_width(80);

  auto run = [&](const std::string& line) {
    out.str("");
    out.clear();
    bool more = nav.execute(line);
    return std::make_pair(more, out.str());
  };

  // paging
  auto r = run("ls 2");
  expect(has(r.second, "Messages 0 to 1"), "ls 2 shows the first page");
  expect(has(r.second, "Quarterly report") && !has(r.second, "Year end"), "ls 2 lists rows 0..1 only");
  r = run("next 2");
  expect(has(r.second, "Messages 2 to 3"), "next continues");
  r = run("prev 2");
  expect(has(r.second, "Messages 0 to 1"), "prev goes back one page");
  r = run("ls 0");
  expect(has(r.second, "Messages 2 to 4"), "a zero count falls back to the page size");
  r = run("ls");
  expect(has(r.second, "Messages 0 to 4"), "paging wraps to the start");

  // show
  r = run("show 1");
  expect(has(r.second, "From: Bob R\xC3\xA9" "al <bob@example.org>"), "decoded From in show");
  expect(has(r.second, "Cc: carol@example.com"), "Cc in show");
  expect(has(r.second, "Subject: Caf\xC3\xA9 meeting"), "decoded Subject in show");
  expect(has(r.second, "Let's meet at the caf\xC3\xA9."), "plain part decoded from quoted-printable");
  expect(!has(r.second, "html only"), "html part skipped");
  expect(has(r.second, std::string(80, '=')), "rule follows the terminal width");
  r = run("show 4");
  expect(has(r.second, "Hello Carol!"), "base64 body decoded");
  r = run("show 99");
  expect(has(r.second, "Index out of range."), "out of range index reported");
  r = run("show abc");
  expect(has(r.second, "Usage: show <index>"), "show usage");
  expect(r.first, "errors keep the loop running");

  // search
  r = run("search ALICE");
  expect(has(r.second, "Found 2 matches (showing first 100)"), "search total");
  r = run("search zebra");
  expect(has(r.second, "No matches found"), "no matches");
  r = run("search   ");
  expect(has(r.second, "search <text>"), "blank search refused");

  // sort then save the new first row
  r = run("sort date desc");
  expect(has(r.second, "Sorted by date descending"), "sort message");
  expect(session.table().front().key == 4 && session.table().back().key == 3,
         "newest first, undated last");
  r = run("sort bogus");
  expect(has(r.second, "Usage: sort <field> [desc]"), "sort usage");

  const fs::path saved = fs::temp_directory_path() / "mn_nav_test" / "saved.eml";
  fs::remove_all(saved.parent_path());
  r = run("save 0 " + saved.string());
  expect(has(r.second, "Saved"), "save confirmation");
  {
    std::ifstream in(saved, std::ios::binary);
    std::ostringstream ss; ss << in.rdbuf();
    const std::string eml = ss.str();
    expect(eml.compare(0, 6, "From: ") == 0, "saved message starts at its headers");
    expect(has(eml, "Subject: Re: Year end") && has(eml, "SGVsbG8gQ2Fyb2wh"), "saved message is raw");
  }
  fs::remove_all(saved.parent_path());
  r = run("save 0");
  expect(has(r.second, "Usage: save <index> <outfile.eml>"), "save usage");

  // info
  r = run("info");
  expect(has(r.second, "Messages    : 5"), "info message count");
  expect(has(r.second, "Date Range  : 2019-12-31 to 2022-07-01"), "info date range");
  const auto com = r.second.find("@example.com: 3 messages");
  const auto org = r.second.find("@example.org: 1 messages");
  const auto net = r.second.find("@lists.example.net: 1 messages");
  expect(com != std::string::npos && org != std::string::npos && net != std::string::npos &&
         com < org && org < net, "top domains by count, ties by name");

  r = run("info json");
  {
    simdjson::ondemand::parser p;
    simdjson::padded_string json(r.second);
    auto doc = p.iterate(json);
    uint64_t messages = doc["messages"].get_uint64().value_or(0);
    uint64_t undated = doc["undated"].get_uint64().value_or(0);
    std::string_view earliest = doc["earliest"].get_string().value_or("");
    expect(messages == 5 && undated == 1 && earliest == "2019-12-31", "stats json");
  }

  // columns
  r = run("cols");
  expect(has(r.second, "Current display columns: date,from,subject"), "default columns");
  r = run("cols subject, bogus ,to");
  expect(has(r.second, "Display columns set to: subject,to"), "unknown column dropped");
  r = run("cols bogus");
  expect(has(r.second, "No valid columns specified"), "no valid column keeps the old set");
  expect(session.columns().size() == 2, "columns unchanged after a bad cols");

  r = run("frobnicate now");
  expect(has(r.second, "*** Unknown syntax: frobnicate now") && r.first, "unknown command");

  r = run("quit");
  expect(!r.first && has(r.second, "Good-bye!"), "quit ends the loop");

  // scripted loop ending at end of input
  std::istringstream script("help\nls 1\n");
  out.str("");
  nav.run(script, false);
  expect(has(out.str(), "sort <field> [desc]") && has(out.str(), "Good-bye!"), "run() until EOF");

  if (failures) return 1;
  std::cout << "[PASS] navigator session\n";
  return 0;
}
