#pragma once
#include "chatpack/message.hpp"
#include "chatpack/raw_record.hpp"
#include <optional>
#include <string>

namespace cp {

// Maps decoded records to Message and decides keep/drop:
//  - Telegram: kind must be "message" and a sender must be present
//  - WhatsApp: service entries dropped when skip_system is set
//  - Discord: attachment/sticker tags appended to the text unless
//    include_attachments is off
//  - every dialect: content that is blank after trimming is dropped
class Normalizer {
public:
  explicit Normalizer(bool skip_system = true, bool include_attachments = true)
    : skip_system_(skip_system), include_attachments_(include_attachments) {}

  std::optional<Message> normalize(RawRecord raw) const;

  std::optional<Message> operator()(TelegramRecord&& r) const;
  std::optional<Message> operator()(WhatsAppRecord&& r) const;
  std::optional<Message> operator()(InstagramRecord&& r) const;
  std::optional<Message> operator()(DiscordRecord&& r) const;

private:
  bool skip_system_;
  bool include_attachments_;
};

// Text followed by "[Attachment: name]" / "[Sticker: name]" lines.
std::string discord_content(const DiscordRecord& r);

}
