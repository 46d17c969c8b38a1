#include "chatpack/metrics.hpp"
#include "chatpack/stream_error.hpp"
#include <chrono>

namespace cp {

void MetricsRegistry::reset() {
  units_ = messages_ = dropped_ = skipped_ = surfaced_ = bytes_ = 0;
  kind_errs_.clear();
  stage_accum_ms_.clear();
  stage_starts_.clear();
}

void MetricsRegistry::add_error(ErrorKind kind, bool skipped) {
  if (skipped) ++skipped_; else ++surfaced_;
  ++kind_errs_[error_kind_name(kind)];
}

std::uint64_t MetricsRegistry::errors_of(ErrorKind kind) const {
  auto it = kind_errs_.find(error_kind_name(kind));
  return it == kind_errs_.end() ? 0 : it->second;
}

void MetricsRegistry::start_stage(std::string_view name) {
  stage_starts_[std::string(name)] = std::chrono::steady_clock::now();
}

void MetricsRegistry::end_stage(std::string_view name) {
  auto key = std::string(name);
  auto it = stage_starts_.find(key);
  if (it == stage_starts_.end()) return;
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
              std::chrono::steady_clock::now() - it->second).count();
  stage_accum_ms_[key] += static_cast<std::uint64_t>(ms);
  stage_starts_.erase(it);
}

RunStats MetricsRegistry::snapshot(double wall_ms) const {
  RunStats r;
  r.units = units_;
  r.messages = messages_;
  r.dropped = dropped_;
  r.errors_skipped = skipped_;
  r.errors_surfaced = surfaced_;
  r.bytes = bytes_;
  const double sec = wall_ms / 1000.0;
  r.throughput_mb_s = (sec > 0.0) ? (bytes_ / (1024.0*1024.0)) / sec : 0.0;
  r.messages_per_sec = (sec > 0.0) ? messages_ / sec : 0.0;

  r.errors_by_kind = kind_errs_;
  r.stages.reserve(stage_accum_ms_.size());
  for (auto& kv : stage_accum_ms_) r.stages.push_back(StageTiming{kv.first, kv.second});
  return r;
}

}
