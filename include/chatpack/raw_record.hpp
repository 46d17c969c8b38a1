#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace cp {

// Decoded, not yet normalized, record of each dialect.

struct TelegramRecord {
  std::string kind;                        // "message", "service", ...
  std::optional<std::string> from;         // absent or null for channel posts
  std::string text;                        // rich-text runs already concatenated
  std::optional<std::int64_t>  date;
  std::optional<std::uint64_t> id;
  std::optional<std::uint64_t> reply_to;
  std::optional<std::int64_t>  edited;
};

struct WhatsAppRecord {
  std::string sender;
  std::string content;                     // continuation lines joined with '\n'
  std::optional<std::int64_t> timestamp;
};

struct InstagramRecord {
  std::string sender;
  std::string content;                     // content, else share.share_text
  std::optional<std::int64_t> timestamp;
};

struct DiscordRecord {
  std::optional<std::uint64_t> id;
  std::string sender;                      // nickname, else account name
  std::string content;
  std::optional<std::int64_t>  timestamp;
  std::optional<std::int64_t>  edited;
  std::optional<std::uint64_t> reply_to;
  std::vector<std::string> attachments;    // file names
  std::vector<std::string> stickers;       // sticker names
};

using RawRecord = std::variant<TelegramRecord, WhatsAppRecord, InstagramRecord, DiscordRecord>;

}
