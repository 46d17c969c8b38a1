#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace cp {

// Piece of input handed out by ChunkReader::next_segment. `text` never
// contains '\n'; `line_end` is true when the piece closes a line.
// The view is valid until the next call on the reader.
struct Segment {
  std::string_view text;
  bool line_end = false;
};

class ChunkReader {
public:
  struct Config {
    std::size_t chunk_bytes = 64 * 1024;  // read-ahead block
    bool        strip_cr    = true;       // trim trailing '\r' (CRLF) in read_line
  };

  explicit ChunkReader(std::string path);      // uses default Config{}
  ChunkReader(std::string path, Config cfg);   // explicit Config
  ~ChunkReader();

  ChunkReader(const ChunkReader&) = delete;
  ChunkReader& operator=(const ChunkReader&) = delete;

  // Opens the file and records its size. False on failure (see last_error()).
  bool open();
  bool is_open() const noexcept;
  void close() noexcept;

  // Back to the first byte; consumed byte count restarts at zero.
  bool rewind();

  // Next line or line piece. Lines longer than chunk_bytes come out in
  // several pieces, the last one carrying line_end. False at EOF or on a
  // read error (failed() tells them apart).
  bool next_segment(Segment& out);

  // Assembles a whole line into `out` (without '\n'). A line longer than
  // `max_bytes` is consumed to its end but not stored: `oversize` is set
  // and `out` holds the first `max_bytes` bytes. False at EOF / error.
  bool read_line(std::string& out, std::size_t max_bytes, bool& oversize,
                 std::uint64_t* line_bytes = nullptr);

  bool          failed() const noexcept;
  int           last_error() const noexcept;
  std::uint64_t bytes_read() const noexcept;   // bytes consumed so far
  std::uint64_t file_size() const noexcept;
  const std::string& path() const noexcept;

private:
  struct Impl; Impl* p_;
};

}
