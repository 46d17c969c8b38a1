#pragma once
#include "chatpack/message.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cp {

// Date range and sender filter; all set conditions must hold.
struct FilterConfig {
  std::optional<std::int64_t> after_ms;    // inclusive
  std::optional<std::int64_t> before_ms;   // inclusive
  std::optional<std::string>  sender;      // ASCII case-insensitive equality

  // YYYY-MM-DD; after starts at 00:00:00, before ends at 23:59:59.999 UTC.
  bool set_after(std::string_view ymd);
  bool set_before(std::string_view ymd);

  bool has_date_filter() const noexcept { return after_ms.has_value() || before_ms.has_value(); }
  bool is_active() const noexcept { return has_date_filter() || sender.has_value(); }

  // Messages without a timestamp fail any date condition.
  bool matches(const Message& m) const;
};

}
