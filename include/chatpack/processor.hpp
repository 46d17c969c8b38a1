#pragma once
#include "chatpack/message.hpp"
#include <cstdint>
#include <optional>

namespace cp {

// Merges runs of consecutive messages from the same sender. Contents are
// joined with '\n'; the first message of a run keeps its metadata.
// Holds at most one message.
class MessageMerger {
public:
  // Returns the finished run when `m` starts a new one.
  std::optional<Message> push(Message m);

  // Returns the last run, if any.
  std::optional<Message> flush();

  std::uint64_t merged() const noexcept { return merged_; }

private:
  std::optional<Message> cur_;
  std::uint64_t merged_{0};
};

}
