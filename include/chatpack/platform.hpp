#pragma once
#include <optional>
#include <string_view>

namespace cp {

enum class Platform { Telegram, WhatsApp, Instagram, Discord };

const char* platform_name(Platform p) noexcept;

// Accepts names and short aliases (tg, wa, ig, dc), case-insensitive.
std::optional<Platform> parse_platform(std::string_view s);

}
