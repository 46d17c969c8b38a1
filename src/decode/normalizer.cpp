#include "chatpack/normalizer.hpp"
#include "chatpack/whatsapp_format.hpp"
#include <cctype>
#include <string_view>
#include <utility>
#include <variant>

namespace cp {

static bool is_space(char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; }

static std::string_view trim(std::string_view s) {
  while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
  while (!s.empty() && is_space(s.back())) s.remove_suffix(1);
  return s;
}

static bool blank(std::string_view s) { return trim(s).empty(); }

std::string discord_content(const DiscordRecord& r) {
  std::string content = r.content;
  for (const auto& a : r.attachments) {
    if (!content.empty()) content.push_back('\n');
    content.append("[Attachment: ").append(a).append("]");
  }
  for (const auto& s : r.stickers) {
    if (!content.empty()) content.push_back('\n');
    content.append("[Sticker: ").append(s).append("]");
  }
  return content;
}

std::optional<Message> Normalizer::normalize(RawRecord raw) const {
  return std::visit([this](auto&& r) { return (*this)(std::move(r)); }, std::move(raw));
}

std::optional<Message> Normalizer::operator()(TelegramRecord&& r) const {
  if (r.kind != "message" || !r.from) return std::nullopt;
  if (blank(r.text)) return std::nullopt;
  Message m;
  m.sender = std::move(*r.from);
  m.content = std::move(r.text);
  m.timestamp = r.date;
  m.id = r.id;
  m.reply_to = r.reply_to;
  m.edited = r.edited;
  return m;
}

std::optional<Message> Normalizer::operator()(WhatsAppRecord&& r) const {
  if (skip_system_ && is_system_message(r.sender, r.content)) return std::nullopt;
  std::string_view body = trim(r.content);
  if (body.empty()) return std::nullopt;
  Message m;
  m.sender = std::move(r.sender);
  m.content = std::string(body);
  m.timestamp = r.timestamp;
  return m;
}

std::optional<Message> Normalizer::operator()(InstagramRecord&& r) const {
  if (blank(r.content)) return std::nullopt;
  Message m;
  m.sender = std::move(r.sender);
  m.content = std::move(r.content);
  m.timestamp = r.timestamp;
  return m;
}

std::optional<Message> Normalizer::operator()(DiscordRecord&& r) const {
  std::string content = include_attachments_ ? discord_content(r) : std::move(r.content);
  if (blank(content)) return std::nullopt;
  Message m;
  m.sender = std::move(r.sender);
  m.content = std::move(content);
  m.timestamp = r.timestamp;
  m.id = r.id;
  m.reply_to = r.reply_to;
  m.edited = r.edited;
  return m;
}

}
