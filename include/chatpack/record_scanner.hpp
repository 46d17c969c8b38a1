#pragma once
#include "chatpack/stream_error.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace cp {

class ChunkReader;

// Carves the objects of one JSON array ("messages": [ {...}, {...} ])
// out of a document without parsing the document. Memory held is the
// reader's block plus the record being carved.
class RecordScanner {
public:
  struct Config {
    std::string key              = "messages";
    std::size_t max_record_size  = 10 * 1024 * 1024;
    std::size_t locate_cap_bytes = 10 * 1024 * 1024;
    bool        string_aware     = true;   // braces inside "..." do not count
    std::size_t retain_bytes     = 64 * 1024;  // buffer kept after an oversized record
  };

  enum class Status { Record, End, Error };

  RecordScanner(ChunkReader& reader, Config cfg);
  ~RecordScanner();

  RecordScanner(const RecordScanner&) = delete;
  RecordScanner& operator=(const RecordScanner&) = delete;

  // Positions the scanner just past the '[' that opens the array. The '['
  // must follow the quoted key on the same line. False with a fatal
  // InvalidFormat (not found, or cap exceeded) or Io error.
  bool locate();

  // Record: `out` holds the object text, valid until the next call.
  // End: array closed or input exhausted between objects.
  // Error: see error(); fatal errors end the scan, others do not.
  Status next_record(std::string_view& out);

  const StreamError& error() const noexcept { return err_; }
  std::uint64_t records() const noexcept;       // objects carved so far
  std::size_t   high_water() const noexcept;    // largest record buffered
  std::size_t   buffer_capacity() const noexcept;

private:
  struct Impl; Impl* p_;
  StreamError err_;
};

}
