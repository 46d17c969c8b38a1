#include "chatpack/progress.hpp"

namespace cp {

std::optional<double> ProgressSnapshot::percentage() const noexcept {
  if (!total_bytes) return std::nullopt;
  if (*total_bytes == 0) return 100.0;
  double pct = static_cast<double>(bytes_processed) / static_cast<double>(*total_bytes) * 100.0;
  return pct > 100.0 ? 100.0 : pct;
}

bool ProgressTracker::report_due(std::uint64_t interval) noexcept {
  if (interval == 0) return false;
  if (items_ - last_report_ < interval) return false;
  last_report_ = items_ - (items_ % interval);
  return true;
}

ProgressSnapshot ProgressTracker::snapshot() const noexcept {
  ProgressSnapshot s;
  s.bytes_processed = bytes_;
  s.total_bytes = total_;
  s.items_processed = items_;
  return s;
}

}
