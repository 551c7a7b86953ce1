#include "mbox_nav/partitioner.hpp"
#include "mbox_nav/header_decode.hpp"
#include "mbox_nav/headers.hpp"
#include "mbox_nav/interrupt.hpp"
#include "mbox_nav/metrics.hpp"
#include "mbox_nav/path_utils.hpp"
#include <algorithm>
#include <chrono>
#include <ostream>

namespace mn {

YearMatch classify_record(std::string_view message, MetricsRegistry* metrics) {
  bool fell_back = false;
  std::string date = decode_header(find_header(message, "Date"), &fell_back);
  if (fell_back && metrics) metrics->add_decode_fallback("Date");
  return classify_year_traced(date);
}

std::optional<PartitionCounts> partition(ArchiveReader& reader, ArchiveWriter& writer,
                                         std::string_view target_year,
                                         const PartitionOptions& opt,
                                         MetricsRegistry* metrics, Error* err) {
  StageTimer timer(metrics, "classify");
  PartitionCounts c;

  while (auto key = reader.next_key()) {
    if (interrupt_requested()) { c.interrupted = true; break; }

    Error get_err;
    auto rec = reader.get(*key, &get_err);
    if (!rec) {
      if (err) *err = get_err;
      return std::nullopt;
    }
    ++c.scanned;
    if (metrics) { metrics->add_record(); metrics->add_bytes(rec->raw().size()); }

    YearMatch m = classify_record(rec->message(), metrics);
    if (opt.debug && opt.log) {
      *opt.log << "[split] record " << *key << ": "
               << (m.year ? *m.year : std::string("none")) << " via " << to_string(m.source) << "\n";
    }
    if (!m.year) {
      ++c.unclassified;
      if (metrics) metrics->add_unclassified();
      continue;
    }
    if (*m.year != target_year) continue;

    if (!writer.append(*rec, err)) return std::nullopt;
    ++c.matched;
    if (opt.debug && opt.log && c.matched <= 5) {
      *opt.log << "Matched: " << find_header(rec->message(), "Date").value_or("")
               << " -> " << *m.year << " (" << to_string(m.source) << ")\n";
    }
  }

  if (!c.interrupted && reader.last_error()) {
    if (err) *err = reader.last_error();
    return std::nullopt;
  }
  return c;
}

std::size_t sample_classification(ArchiveReader& reader, std::size_t count, std::ostream& out) {
  std::size_t shown = 0;
  while (shown < count) {
    auto key = reader.next_key();
    if (!key) break;
    auto rec = reader.get(*key);
    if (!rec) break;
    ++shown;

    std::string date = decode_header(find_header(rec->message(), "Date"));
    std::string subject = decode_header(find_header(rec->message(), "Subject"));
    YearMatch m = classify_year_traced(date);

    out << "\nMessage " << shown << ":\n";
    out << "  Subject: " << subject.substr(0, 50) << "...\n";
    out << "  Date header: " << date << "\n";
    if (m.year) out << "  Found year via " << to_string(m.source) << ": " << *m.year << "\n";
    else        out << "  Failed to parse date\n";
    out << "  Extracted year: " << (m.year ? *m.year : std::string("None")) << "\n";
  }
  return shown;
}

std::optional<PartitionReport> partition_file(const SplitJob& job, std::ostream& out, Error* err) {
  if (err) err->clear();
  const auto t0 = std::chrono::steady_clock::now();

  ArchiveReader reader;
  if (!reader.open(job.source, err)) return std::nullopt;

  PartitionReport report;
  report.source = job.source;
  report.output = job.output;
  report.target_year = job.year;

  MetricsRegistry metrics;
  {
    StageTimer scan(&metrics, "scan");
    report.total = reader.count();
    if (reader.last_error()) {
      if (err) *err = reader.last_error();
      return std::nullopt;
    }
  }
  out << "Processing " << report.total << " messages...\n";

  // count() consumed the key sequence; a second session re-enumerates it
  ArchiveReader stream;
  if (!stream.open(job.source, err)) return std::nullopt;

  if (job.sample_count > 0) {
    std::size_t n = std::min<std::size_t>(job.sample_count, report.total);
    out << "\nSAMPLE MODE: Showing date parsing for " << n << " messages\n";
    report.scanned = sample_classification(stream, n, out);
    return report;
  }

  {
    ArchiveWriter writer;
    if (!ensure_parent_dirs(job.output) ||
        !writer.open(job.output, ArchiveWriter::Mode::Truncate, err)) {
      if (err && !*err) set_error(err, ErrorKind::Io, "cannot create " + job.output);
      return std::nullopt;
    }

    PartitionOptions opt;
    opt.debug = job.debug;
    opt.log = &out;
    auto counts = partition(stream, writer, job.year, opt, &metrics, err);
    if (!counts) return std::nullopt;   // writer unlocks and closes on scope exit

    report.scanned = counts->scanned;
    report.matched = counts->matched;
    report.unclassified = counts->unclassified;
    report.interrupted = counts->interrupted;
    report.bytes_written = writer.bytes_written();
    if (!writer.sync(err)) return std::nullopt;
  }

  if (auto digest = sha256_file_hex(job.output)) report.output_sha256 = *digest;

  const double wall_ms = std::chrono::duration<double, std::milli>(
      std::chrono::steady_clock::now() - t0).count();
  report.stats = metrics.snapshot(wall_ms);

  if (report.interrupted) out << "\nOperation interrupted by user\n";
  out << "Processed " << report.scanned << " messages\n";
  out << "Extracted " << report.matched << " messages from year " << job.year
      << " to " << job.output << "\n";
  return report;
}

}
