#include "chatpack/platform.hpp"
#include <cctype>
#include <string>

namespace cp {

const char* platform_name(Platform p) noexcept {
  switch (p) {
    case Platform::Telegram:  return "telegram";
    case Platform::WhatsApp:  return "whatsapp";
    case Platform::Instagram: return "instagram";
    case Platform::Discord:   return "discord";
  }
  return "unknown";
}

std::optional<Platform> parse_platform(std::string_view s) {
  std::string k(s);
  for (auto& c : k) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (k == "telegram"  || k == "tg") return Platform::Telegram;
  if (k == "whatsapp"  || k == "wa") return Platform::WhatsApp;
  if (k == "instagram" || k == "ig") return Platform::Instagram;
  if (k == "discord"   || k == "dc") return Platform::Discord;
  return std::nullopt;
}

}
