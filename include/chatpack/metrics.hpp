#pragma once
#include <cstdint>
#include <chrono>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cp {

enum class ErrorKind;

struct StageTiming {
  std::string name;
  std::uint64_t duration_ms = 0;
};

struct RunStats {
  std::uint64_t units = 0;            // carved records / line records seen
  std::uint64_t messages = 0;         // emitted
  std::uint64_t dropped = 0;          // removed by normalization rules
  std::uint64_t errors_skipped = 0;
  std::uint64_t errors_surfaced = 0;
  std::uint64_t bytes = 0;
  double throughput_mb_s = 0.0;
  double messages_per_sec = 0.0;

  std::vector<StageTiming> stages;
  std::unordered_map<std::string, std::uint64_t> errors_by_kind;
};

class MetricsRegistry {
public:
  void reset();
  void add_unit() noexcept { ++units_; }
  void add_message() noexcept { ++messages_; }
  void add_dropped() noexcept { ++dropped_; }
  void set_bytes(std::uint64_t b) noexcept { bytes_ = b; }

  void add_error(ErrorKind kind, bool skipped);

  void start_stage(std::string_view name);
  void end_stage(std::string_view name);

  std::uint64_t units() const noexcept { return units_; }
  std::uint64_t messages() const noexcept { return messages_; }
  std::uint64_t dropped() const noexcept { return dropped_; }
  std::uint64_t errors_skipped() const noexcept { return skipped_; }
  std::uint64_t errors_surfaced() const noexcept { return surfaced_; }
  std::uint64_t errors_of(ErrorKind kind) const;

  RunStats snapshot(double wall_ms) const;

private:
  std::uint64_t units_{0};
  std::uint64_t messages_{0};
  std::uint64_t dropped_{0};
  std::uint64_t skipped_{0};
  std::uint64_t surfaced_{0};
  std::uint64_t bytes_{0};
  std::unordered_map<std::string, std::uint64_t> kind_errs_;
  std::unordered_map<std::string, std::uint64_t> stage_accum_ms_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> stage_starts_;
};

}
