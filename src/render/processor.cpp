#include "chatpack/processor.hpp"
#include <utility>

namespace cp {

std::optional<Message> MessageMerger::push(Message m) {
  if (cur_ && cur_->sender == m.sender) {
    cur_->content.push_back('\n');
    cur_->content.append(m.content);
    ++merged_;
    return std::nullopt;
  }
  std::optional<Message> done = std::move(cur_);
  cur_ = std::move(m);
  return done;
}

std::optional<Message> MessageMerger::flush() {
  std::optional<Message> done = std::move(cur_);
  cur_.reset();
  return done;
}

}
