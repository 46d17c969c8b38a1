#pragma once
#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace cp {

struct RunJsonPayload {
  // Counts
  std::uint64_t units = 0;
  std::uint64_t messages_in = 0;       // emitted by the stream
  std::uint64_t messages_out = 0;      // written after filter/merge
  std::uint64_t dropped = 0;
  std::uint64_t filtered = 0;
  std::uint64_t merged = 0;
  std::uint64_t errors_skipped = 0;
  std::uint64_t errors_surfaced = 0;

  // Timing
  std::uint64_t bytes = 0;
  double wall_time_ms = 0.0;
  double throughput_mb_s = 0.0;
  double messages_per_sec = 0.0;
  std::uint64_t peak_record_bytes = 0;

  std::vector<std::pair<std::string, std::uint64_t>> stage_times;
  std::unordered_map<std::string, std::uint64_t> errors_by_kind;

  // Input / output metadata
  std::string filename;
  std::string platform;
  std::string output;
  std::string output_format;
  std::uint64_t file_size = 0;
};

class RunJsonWriter {
public:
  // Serialize payload to a JSON object string.
  static std::string to_json(const RunJsonPayload& p);
};

// Writes `s` as a quoted JSON string.
void json_escape(std::ostream& o, std::string_view s);

}
