#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace cp {

// Dialect-independent message. Instants are epoch milliseconds (UTC).
struct Message {
  std::string sender;
  std::string content;
  std::optional<std::int64_t>  timestamp;
  std::optional<std::uint64_t> id;
  std::optional<std::uint64_t> reply_to;
  std::optional<std::int64_t>  edited;

  bool operator==(const Message& o) const {
    return sender == o.sender && content == o.content && timestamp == o.timestamp &&
           id == o.id && reply_to == o.reply_to && edited == o.edited;
  }
  bool operator!=(const Message& o) const { return !(*this == o); }
};

}
