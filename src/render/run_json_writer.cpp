#include "mbox_nav/run_json.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <sstream>

namespace mn {

static void esc(std::ostringstream& o, const std::string& s){
  o << '"';
  for (char c : s){
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8]; std::snprintf(buf, sizeof buf, "\\u%04x", c);
          o << buf;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

static void stats_fields(std::ostringstream& o, const RunStats& s) {
  o << "\"wall_time_ms\":" << safe_num(s.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(s.throughput_mb_s) << ",";
  o << "\"records_per_sec\":" << safe_num(s.records_per_sec) << ",";
  o << "\"bytes_read\":" << s.bytes << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<s.stages.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, s.stages[i].name);
    o << ",\"duration_ms\":" << s.stages[i].duration_ms << "}";
  }
  o << "],";

  o << "\"decode_fallbacks\":{";
  bool first=true;
  for (auto& kv : s.decode_fallbacks) {
    if (!first) o << ",";
    first=false;
    esc(o, kv.first); o << ":" << kv.second;
  }
  o << "}";
}

std::string RunJsonWriter::to_json(const PartitionReport& r) {
  std::ostringstream o;
  o << "{";
  o << "\"source\":";      esc(o, r.source);      o << ",";
  o << "\"output\":";      esc(o, r.output);      o << ",";
  o << "\"target_year\":"; esc(o, r.target_year); o << ",";
  o << "\"total\":" << r.total << ",";
  o << "\"scanned\":" << r.scanned << ",";
  o << "\"matched\":" << r.matched << ",";
  o << "\"unclassified\":" << r.unclassified << ",";
  o << "\"bytes_written\":" << r.bytes_written << ",";
  o << "\"interrupted\":" << (r.interrupted ? "true" : "false") << ",";
  o << "\"output_sha256\":"; esc(o, r.output_sha256); o << ",";
  stats_fields(o, r.stats);
  o << "}";
  return o.str();
}

std::string RunJsonWriter::to_json(const ArchiveStats& s) {
  std::ostringstream o;
  o << "{";
  o << "\"path\":"; esc(o, s.path); o << ",";
  o << "\"messages\":" << s.messages << ",";
  o << "\"file_bytes\":" << s.file_bytes << ",";
  o << "\"size_mb\":" << safe_num(s.size_mb) << ",";
  o << "\"earliest\":"; if (s.earliest) esc(o, *s.earliest); else o << "null"; o << ",";
  o << "\"latest\":";   if (s.latest)   esc(o, *s.latest);   else o << "null"; o << ",";
  o << "\"undated\":" << s.undated << ",";
  o << "\"top_domains\":[";
  for (size_t i=0;i<s.top_domains.size();++i){
    if (i) o << ",";
    o << "{\"domain\":"; esc(o, s.top_domains[i].first);
    o << ",\"count\":" << s.top_domains[i].second << "}";
  }
  o << "]";
  o << "}";
  return o.str();
}

}
