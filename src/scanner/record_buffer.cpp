#include "chatpack/record_buffer.hpp"
#include <algorithm>
#include <cstring>

namespace cp {

RecordBuffer::RecordBuffer(std::size_t reserve_bytes) : buf_(reserve_bytes), head_(0), high_water_(0) {}

void RecordBuffer::grow(std::size_t need) {
  if (need <= buf_.size()) return;
  std::size_t grow = std::max(need, buf_.size() + buf_.size() / 2 + 1);
  buf_.resize(grow);
}

void RecordBuffer::append(std::string_view s) {
  if (s.empty()) return;
  grow(head_ + s.size());
  std::memcpy(buf_.data() + head_, s.data(), s.size());
  head_ += s.size();
  if (head_ > high_water_) high_water_ = head_;
}

void RecordBuffer::push_back(char c) {
  grow(head_ + 1);
  buf_[head_++] = c;
  if (head_ > high_water_) high_water_ = head_;
}

std::string_view RecordBuffer::view() const noexcept {
  return std::string_view(buf_.data(), head_);
}

void RecordBuffer::reset() noexcept { head_ = 0; }

void RecordBuffer::reset_and_shrink(std::size_t keep_capacity) {
  head_ = 0;
  if (keep_capacity < buf_.size()) {
    buf_.resize(keep_capacity);
    buf_.shrink_to_fit();
  }
}

std::size_t RecordBuffer::capacity() const noexcept { return buf_.size(); }
std::size_t RecordBuffer::high_water() const noexcept { return high_water_; }

}
