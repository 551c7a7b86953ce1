#pragma once
#include <cstdint>
#include <chrono>
#include <map>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace mn {

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct RunStats {
  std::uint64_t records = 0;
  std::uint64_t bytes = 0;
  std::uint64_t unclassified = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double records_per_sec = 0.0;

  std::vector<StageTiming> stages;                    // sorted by name
  std::map<std::string, std::uint64_t> decode_fallbacks;
};

class MetricsRegistry {
public:
  void reset();
  void add_record() noexcept { ++records_; }
  void add_bytes(std::uint64_t b) noexcept { bytes_ += b; }
  void add_unclassified() noexcept { ++unclassified_; }

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  // A header whose encoded words could not be decoded.
  void add_decode_fallback(std::string_view field);

  std::uint64_t records() const noexcept { return records_; }
  std::uint64_t bytes() const noexcept { return bytes_; }

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t records_{0};
  std::uint64_t bytes_{0};
  std::uint64_t unclassified_{0};
  std::map<std::string, std::uint64_t> fallbacks_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

// Times one stage for the lifetime of the object.
class StageTimer {
public:
  StageTimer(MetricsRegistry* m, std::string_view name) : m_(m), name_(name) {
    if (m_) m_->start_stage(name_);
  }
  ~StageTimer() { if (m_) m_->end_stage(name_); }

  StageTimer(const StageTimer&) = delete;
  StageTimer& operator=(const StageTimer&) = delete;

private:
  MetricsRegistry* m_;
  std::string name_;
};

}
