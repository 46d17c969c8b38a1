#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cp {

// All instants are epoch milliseconds, UTC.

// RFC 3339 date-time: YYYY-MM-DDTHH:MM:SS[.frac](Z|+HH:MM|-HH:MM).
// 'T' may also be 't' or a space. The offset is required.
std::optional<std::int64_t> parse_rfc3339_ms(std::string_view s);

// Decimal epoch seconds ("1705314600"), optionally signed.
std::optional<std::int64_t> parse_unix_seconds_ms(std::string_view s);

// YYYY-MM-DD at 00:00:00 UTC.
std::optional<std::int64_t> parse_ymd_ms(std::string_view s);

// strftime-like template parse. Supported: %d %m %y %Y %H %I %M %S %p %%.
// A space in the template matches zero or more whitespace characters;
// every other character must match literally and the whole input must
// be consumed. %y maps 69-99 to 19xx and 00-68 to 20xx.
std::optional<std::int64_t> parse_with_template(std::string_view text, std::string_view tmpl);

// strftime() over the UTC calendar time of `ms`.
std::string format_utc(std::int64_t ms, const char* fmt);

}
