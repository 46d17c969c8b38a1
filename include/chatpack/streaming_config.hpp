#pragma once
#include <cstddef>
#include <cstdint>

namespace cp {

struct StreamingConfig {
  std::size_t   buffer_size        = 64 * 1024;          // read-ahead block
  std::size_t   max_record_size    = 10 * 1024 * 1024;   // per carved record / line
  bool          skip_invalid       = true;               // drop per-record errors silently
  std::uint64_t progress_interval  = 10000;              // messages between progress reports
  bool          fix_encoding       = true;               // Instagram mojibake repair
  bool          skip_system_messages = true;             // WhatsApp service lines
  bool          string_aware_scan  = true;               // ignore braces inside JSON strings
  std::size_t   locate_cap_bytes   = 10 * 1024 * 1024;   // search window for the messages array
  bool          prefer_nickname    = true;               // Discord: server nickname over account name
  bool          include_attachments = true;              // Discord: [Attachment: ...] / [Sticker: ...] lines

  // Larger read-ahead for big files on fast storage.
  static StreamingConfig streaming_optimized() {
    StreamingConfig c;
    c.buffer_size = 256 * 1024;
    return c;
  }
};

}
