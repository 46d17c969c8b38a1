#pragma once
#include <cstddef>
#include <string_view>
#include <vector>

namespace cp {

// Growable byte buffer holding the record currently being carved.
// Storage is reused across records; high_water() remembers the largest
// record ever held so callers can check the memory bound.
class RecordBuffer {
public:
  explicit RecordBuffer(std::size_t reserve_bytes = 0);

  void append(std::string_view s);
  void push_back(char c);
  std::string_view view() const noexcept;

  // Reset head to zero; capacity stays (reuse buffer).
  void reset() noexcept;

  // Reset and optionally shrink capacity to `keep_capacity` bytes.
  void reset_and_shrink(std::size_t keep_capacity = 0);

  std::size_t size() const noexcept { return head_; }
  bool        empty() const noexcept { return head_ == 0; }
  std::size_t capacity() const noexcept;
  std::size_t high_water() const noexcept;

private:
  void grow(std::size_t need);

  std::vector<char> buf_;
  std::size_t head_{0};
  std::size_t high_water_{0};
};

}
