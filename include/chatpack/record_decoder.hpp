#pragma once
#include "chatpack/raw_record.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cp {

// Decodes one carved JSON object (or JSONL line) into a dialect record.
// Holds a reusable simdjson parser and padding scratch; not thread-safe.
class JsonRecordDecoder {
public:
  JsonRecordDecoder();
  ~JsonRecordDecoder();

  JsonRecordDecoder(const JsonRecordDecoder&) = delete;
  JsonRecordDecoder& operator=(const JsonRecordDecoder&) = delete;

  bool decode_telegram(std::string_view text, TelegramRecord& out);
  bool decode_instagram(std::string_view text, InstagramRecord& out, bool fix_encoding);
  bool decode_discord(std::string_view text, DiscordRecord& out, bool prefer_nickname = true);

  const std::string& error() const { return err_; }

private:
  struct Impl; Impl* p_;
  std::string err_;
};

// Column positions of a DiscordChatExporter CSV header.
struct DiscordCsvColumns {
  int author_id   = -1;
  int author      = -1;
  int date        = -1;
  int content     = -1;
  int attachments = -1;

  // nullopt unless Author and Content are present.
  static std::optional<DiscordCsvColumns> from_header(const std::vector<std::string>& header);
};

bool decode_discord_csv(const std::vector<std::string>& row, const DiscordCsvColumns& cols,
                        DiscordRecord& out, std::string& err);

// Message header of a DiscordChatExporter TXT export:
// "[1/15/2024 10:30 AM] alice" or "[1/15/2024 18:30:05] alice".
struct DiscordTxtHeader {
  std::string sender;
  std::optional<std::int64_t> timestamp;
};

bool match_discord_txt_header(std::string_view line, DiscordTxtHeader& out);

// Last path segment of an attachment URL; other text comes back as is.
std::string_view attachment_name(std::string_view item);

// Undoes UTF-8 text that was decoded as Latin-1 and re-encoded
// ("ÐŸÑ€Ð¸Ð²ÐµÑ‚" -> "Привет"). Returns the input unchanged when any
// character is above U+00FF or the reinterpreted bytes are not UTF-8.
std::string fix_mojibake(std::string_view s);

// Unsigned decimal, no sign, no surrounding spaces.
std::optional<std::uint64_t> parse_u64(std::string_view s);

}
