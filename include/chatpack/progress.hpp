#pragma once
#include <cstdint>
#include <optional>

namespace cp {

struct ProgressSnapshot {
  std::uint64_t bytes_processed = 0;
  std::optional<std::uint64_t> total_bytes;
  std::uint64_t items_processed = 0;

  // bytes_processed / total_bytes * 100, clamped to 100; 100 when total is 0.
  std::optional<double> percentage() const noexcept;
};

// Byte and item accounting for one stream. Byte counts only move forward.
class ProgressTracker {
public:
  void set_total(std::optional<std::uint64_t> total) noexcept { total_ = total; }
  void advance_to(std::uint64_t bytes) noexcept { if (bytes > bytes_) bytes_ = bytes; }
  void add_items(std::uint64_t n = 1) noexcept { items_ += n; }

  // Snaps bytes to the known total.
  void finish() noexcept { if (total_ && *total_ > bytes_) bytes_ = *total_; }

  // True once per `interval` items (interval 0 disables).
  bool report_due(std::uint64_t interval) noexcept;

  ProgressSnapshot snapshot() const noexcept;
  std::uint64_t items() const noexcept { return items_; }
  std::uint64_t bytes() const noexcept { return bytes_; }

private:
  std::uint64_t bytes_{0};
  std::uint64_t items_{0};
  std::uint64_t last_report_{0};
  std::optional<std::uint64_t> total_;
};

}
