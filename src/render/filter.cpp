#include "chatpack/filter.hpp"
#include "chatpack/date_parse.hpp"
#include <cctype>

namespace cp {

static bool iequals_ascii(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (std::size_t i = 0; i < a.size(); ++i)
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i]))) return false;
  return true;
}

bool FilterConfig::set_after(std::string_view ymd) {
  auto ms = parse_ymd_ms(ymd);
  if (!ms) return false;
  after_ms = *ms;
  return true;
}

bool FilterConfig::set_before(std::string_view ymd) {
  auto ms = parse_ymd_ms(ymd);
  if (!ms) return false;
  before_ms = *ms + 24LL * 3600 * 1000 - 1;
  return true;
}

bool FilterConfig::matches(const Message& m) const {
  if (has_date_filter()) {
    if (!m.timestamp) return false;
    if (after_ms && *m.timestamp < *after_ms) return false;
    if (before_ms && *m.timestamp > *before_ms) return false;
  }
  if (sender && !iequals_ascii(m.sender, *sender)) return false;
  return true;
}

}
