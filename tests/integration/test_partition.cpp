#include "mbox_nav/archive.hpp"
#include "mbox_nav/interrupt.hpp"
#include "mbox_nav/partitioner.hpp"
#include "mbox_nav/path_utils.hpp"
#include "mbox_nav/run_json.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <simdjson.h>

namespace fs = std::filesystem;

static int failures = 0;

static void expect(bool cond, const std::string& what) {
  if (cond) return;
  std::cerr << "[FAIL] " << what << "\n";
  ++failures;
}

static std::string slurp(const fs::path& p) {
  std::ifstream in(p, std::ios::binary);
  std::ostringstream ss; ss << in.rdbuf();
  return ss.str();
}

// Ten records; 1, 2, 5 and 8 carry 2021 dates in three different shapes.
static void write_source(const fs::path& p) {
  const std::vector<std::string> dates = {
    "Date: Mon, 04 Jan 2020 10:00:00 +0000\n",
    "Date: Fri, 01 Jan 2021 09:00:00 +0000\n",
    "Date: Sat, 02 Jan 2021 09:00:00 +0000\n",
    "",                                               // no Date header
    "Date: not a date at all\n",
    "Date: garbled-2021-xx\n",
    "Date: 3 Mar 1998 12:00:00 GMT\n",
    "Date: 1 Jan 2022 00:00:00 +0000\n",
    "Date: =?utf-8?Q?Sun=2C_3_Jan_2021?=\n",
    "Date: Tue, 31 Dec 2019 23:59:59 -0800\n",
  };
  std::ofstream o(p, std::ios::binary);
  for (std::size_t i = 0; i < dates.size(); ++i) {
    if (i) o << "\n";
    o << "From sender" << i << "@example.com Thu Jan  1 00:00:00 1970\n"
      << "From: sender" << i << "@example.com\n"
      << dates[i]
      << "Subject: message " << i << "\n"
      << "\n"
      << "body " << i << "\n";
  }
}

static std::vector<std::string> subjects_of(const fs::path& p) {
  std::vector<std::string> out;
  mn::ArchiveReader r;
  if (!r.open(p.string())) return out;
  while (auto k = r.next_key()) {
    auto rec = r.get(*k);
    if (!rec) break;
    auto pos = rec->raw().find("Subject: ");
    out.push_back(rec->raw().substr(pos + 9, rec->raw().find('\n', pos) - pos - 9));
  }
  return out;
}

int main() {
  const fs::path dir = fs::temp_directory_path() / "mn_partition_test";
  fs::remove_all(dir);
  fs::create_directories(dir);
  const fs::path src = dir / "full.mbox";
  const fs::path out = dir / "nested" / "split-2021.mbox";
  write_source(src);

  mn::SplitJob job;
  job.source = src.string();
  job.year = "2021";
  job.output = out.string();

  std::ostringstream log;
  mn::Error err;
  auto report = mn::partition_file(job, log, &err);
  expect(report.has_value(), "partition_file: " + err.message);
  if (!report) return 1;

  expect(report->total == 10 && report->scanned == 10, "all ten records scanned");
  expect(report->matched == 4, "four records classified as 2021");
  expect(report->unclassified == 2, "missing and unparseable dates are unclassified");
  expect(!report->interrupted, "not interrupted");
  expect(subjects_of(out) == std::vector<std::string>({"message 1", "message 2", "message 5", "message 8"}),
         "matches appended in source order");
  expect(log.str().find("Processing 10 messages...") != std::string::npos, "processing banner");
  expect(log.str().find("Extracted 4 messages from year 2021 to " + out.string()) != std::string::npos,
         "summary line");

  // idempotent: a second run truncates and produces the same bytes
  const std::string first_sha = report->output_sha256;
  expect(first_sha.size() == 64, "sha-256 recorded");
  std::ostringstream log2;
  auto again = mn::partition_file(job, log2, &err);
  expect(again && again->output_sha256 == first_sha, "re-run yields an identical archive");
  expect(mn::sha256_file_hex(out).value_or("") == first_sha, "digest matches file contents");

  // report round trip through simdjson
  const fs::path report_path = dir / "report.json";
  expect(mn::write_file(report_path, mn::RunJsonWriter::to_json(*report), &err), "write report");
  {
    simdjson::ondemand::parser p;
    auto json = simdjson::padded_string::load(report_path.string());
    auto doc = p.iterate(json);
    uint64_t matched = doc["matched"].get_uint64().value_or(0);
    uint64_t total = doc["total"].get_uint64().value_or(0);
    std::string_view sha = doc["output_sha256"].get_string().value_or("");
    bool saw_classify = false;
    for (auto st : doc["stage_times"].get_array()) {
      std::string_view name = st["stage"].get_string().value_or("");
      if (name == "classify") saw_classify = true;
    }
    expect(matched == 4 && total == 10, "report counts");
    expect(sha == first_sha, "report digest");
    expect(saw_classify, "classify stage timed");
  }

  // sample mode leaves the destination alone
  {
    const std::string before = slurp(out);
    mn::SplitJob sample = job;
    sample.sample_count = 3;
    std::ostringstream slog;
    auto r = mn::partition_file(sample, slog, &err);
    expect(r && r->scanned == 3 && r->matched == 0, "sample mode inspects three records");
    expect(slog.str().find("Message 3:") != std::string::npos &&
           slog.str().find("Message 4:") == std::string::npos, "three samples printed");
    expect(slog.str().find("Extracted year: 2021") != std::string::npos, "sample shows extracted year");
    expect(slurp(out) == before, "sample mode does not touch the output");
  }

  // an interrupt before the first record stops cleanly and releases the lock
  {
    mn::request_interrupt();
    std::ostringstream ilog;
    auto r = mn::partition_file(job, ilog, &err);
    mn::clear_interrupt();
    expect(r && r->interrupted && r->scanned == 0, "interrupted run reports no records");
    expect(ilog.str().find("Operation interrupted by user") != std::string::npos, "interrupt message");
    mn::ArchiveWriter w;
    expect(w.open(out.string(), mn::ArchiveWriter::Mode::Append, &err), "lock released after interrupt");
  }

  // destination locked elsewhere: Io error, no partial work
  {
    mn::ArchiveWriter holder;
    expect(holder.open(out.string(), mn::ArchiveWriter::Mode::Append, &err), "hold lock");
    std::ostringstream llog;
    mn::Error lerr;
    auto r = mn::partition_file(job, llog, &lerr);
    expect(!r && lerr.kind == mn::ErrorKind::Io, "locked destination is an Io error");

    // the same error object is reused once the lock is gone
    holder.close();
    std::ostringstream rlog;
    auto retry = mn::partition_file(job, rlog, &lerr);
    expect(retry && retry->matched == 4, "retry after the lock is released succeeds");
    expect(!lerr && lerr.message.empty(), "successful run clears a stale error");
  }

  fs::remove_all(dir);
  if (failures) return 1;
  std::cout << "[PASS] partition: matched=" << report->matched << " sha=" << first_sha.substr(0, 12) << "\n";
  return 0;
}
