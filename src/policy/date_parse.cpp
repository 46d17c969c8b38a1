#include "chatpack/date_parse.hpp"
#include <cctype>
#include <chrono>
#include <ctime>

namespace cp {

static bool is_digit(char c){ return c>='0' && c<='9'; }

static bool parse_int(std::string_view s, int& out) {
  if (s.empty()) return false;
  int v = 0;
  for (char c : s) { if (!is_digit(c)) return false; v = v*10 + (c - '0'); }
  out = v; return true;
}

static std::time_t utc_from_tm(std::tm& tm) {
#if defined(_WIN32)
  return _mkgmtime(&tm);
#else
  return timegm(&tm);
#endif
}

// Builds epoch millis from calendar fields; rejects out-of-range fields
// (timegm would silently normalize 2024-02-31 into March).
static std::optional<std::int64_t> civil_to_ms(int Y, int M, int D, int h, int m, int sec, int ms) {
  if (M < 1 || M > 12 || D < 1 || D > 31) return std::nullopt;
  if (h < 0 || h > 23 || m < 0 || m > 59 || sec < 0 || sec > 60) return std::nullopt;
  std::tm tm{}; tm.tm_year = Y - 1900; tm.tm_mon = M - 1; tm.tm_mday = D;
  tm.tm_hour = h; tm.tm_min = m; tm.tm_sec = (sec == 60) ? 59 : sec;
  std::time_t t = utc_from_tm(tm);
  if (t == (std::time_t)-1 && !(Y == 1969 && M == 12 && D == 31)) return std::nullopt;
  if (tm.tm_mday != D || tm.tm_mon != M - 1) return std::nullopt;

  using namespace std::chrono;
  auto ms_epoch = duration_cast<milliseconds>(system_clock::from_time_t(t).time_since_epoch()).count();
  return static_cast<std::int64_t>(ms_epoch + ms);
}

std::optional<std::int64_t> parse_rfc3339_ms(std::string_view s) {
  if (s.size() < 20) return std::nullopt;
  int Y,M,D,h,m,sec,ms=0;
  if (!(parse_int(s.substr(0,4), Y) && s[4]=='-' && parse_int(s.substr(5,2), M) && s[7]=='-' && parse_int(s.substr(8,2), D)))
    return std::nullopt;
  if (!(s[10]=='T' || s[10]=='t' || s[10]==' ')) return std::nullopt;
  if (!(parse_int(s.substr(11,2), h) && s[13]==':' && parse_int(s.substr(14,2), m) && s[16]==':' && parse_int(s.substr(17,2), sec)))
    return std::nullopt;

  std::size_t i = 19;
  if (i < s.size() && s[i]=='.') {
    std::size_t j = i+1, k = j;
    while (k < s.size() && is_digit(s[k])) ++k;
    if (k == j) return std::nullopt;
    // keep millisecond precision, truncate the rest
    int scale = 100;
    for (std::size_t d = j; d < k && d < j+3; ++d) { ms += (s[d]-'0') * scale; scale /= 10; }
    i = k;
  }
  if (i >= s.size()) return std::nullopt;

  std::int64_t offset_min = 0;
  if (s[i]=='Z' || s[i]=='z') {
    ++i;
  } else if (s[i]=='+' || s[i]=='-') {
    int oh, om;
    if (i+6 > s.size() || !(parse_int(s.substr(i+1,2), oh) && s[i+3]==':' && parse_int(s.substr(i+4,2), om)))
      return std::nullopt;
    if (oh > 23 || om > 59) return std::nullopt;
    offset_min = oh*60 + om;
    if (s[i]=='-') offset_min = -offset_min;
    i += 6;
  } else {
    return std::nullopt;
  }
  if (i != s.size()) return std::nullopt;

  auto local = civil_to_ms(Y, M, D, h, m, sec, ms);
  if (!local) return std::nullopt;
  return *local - offset_min * 60 * 1000;
}

std::optional<std::int64_t> parse_unix_seconds_ms(std::string_view s) {
  if (s.empty()) return std::nullopt;
  bool neg = false;
  std::size_t i = 0;
  if (s[0]=='-' || s[0]=='+') { neg = (s[0]=='-'); i = 1; }
  if (i == s.size() || s.size() - i > 15) return std::nullopt;
  std::int64_t v = 0;
  for (; i < s.size(); ++i) {
    if (!is_digit(s[i])) return std::nullopt;
    v = v*10 + (s[i]-'0');
  }
  return (neg ? -v : v) * 1000;
}

std::optional<std::int64_t> parse_ymd_ms(std::string_view s) {
  int Y,M,D;
  if (s.size() != 10) return std::nullopt;
  if (!(parse_int(s.substr(0,4), Y) && s[4]=='-' && parse_int(s.substr(5,2), M) && s[7]=='-' && parse_int(s.substr(8,2), D)))
    return std::nullopt;
  return civil_to_ms(Y, M, D, 0, 0, 0, 0);
}

// Reads between min_d and max_d digits at `i`.
static bool take_digits(std::string_view s, std::size_t& i, std::size_t min_d, std::size_t max_d, int& out) {
  std::size_t j = i;
  int v = 0;
  while (j < s.size() && j - i < max_d && is_digit(s[j])) { v = v*10 + (s[j]-'0'); ++j; }
  if (j - i < min_d) return false;
  out = v; i = j;
  return true;
}

std::optional<std::int64_t> parse_with_template(std::string_view text, std::string_view tmpl) {
  int Y=1970, M=1, D=1, h=0, m=0, sec=0;
  int hour12 = -1;
  int pm = -1; // -1 unset, 0 AM, 1 PM
  std::size_t i = 0;

  for (std::size_t t = 0; t < tmpl.size(); ++t) {
    char c = tmpl[t];
    if (c == ' ') {
      while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
      continue;
    }
    if (c != '%' || t + 1 >= tmpl.size()) {
      if (i >= text.size() || text[i] != c) return std::nullopt;
      ++i;
      continue;
    }
    char spec = tmpl[++t];
    switch (spec) {
      case 'd': if (!take_digits(text, i, 1, 2, D)) return std::nullopt; break;
      case 'm': if (!take_digits(text, i, 1, 2, M)) return std::nullopt; break;
      case 'H': if (!take_digits(text, i, 1, 2, h)) return std::nullopt; break;
      case 'I': if (!take_digits(text, i, 1, 2, hour12)) return std::nullopt; break;
      case 'M': if (!take_digits(text, i, 1, 2, m)) return std::nullopt; break;
      case 'S': if (!take_digits(text, i, 1, 2, sec)) return std::nullopt; break;
      case 'Y': if (!take_digits(text, i, 4, 4, Y)) return std::nullopt; break;
      case 'y': {
        int yy;
        if (!take_digits(text, i, 2, 2, yy)) return std::nullopt;
        Y = (yy >= 69) ? 1900 + yy : 2000 + yy;
        break;
      }
      case 'p': {
        if (i + 2 > text.size()) return std::nullopt;
        char a = static_cast<char>(std::toupper(static_cast<unsigned char>(text[i])));
        char b = static_cast<char>(std::toupper(static_cast<unsigned char>(text[i+1])));
        if (b != 'M' || (a != 'A' && a != 'P')) return std::nullopt;
        pm = (a == 'P') ? 1 : 0;
        i += 2;
        break;
      }
      case '%':
        if (i >= text.size() || text[i] != '%') return std::nullopt;
        ++i;
        break;
      default:
        return std::nullopt;
    }
  }
  if (i != text.size()) return std::nullopt;

  if (hour12 >= 0) {
    if (pm < 0 || hour12 < 1 || hour12 > 12) return std::nullopt;
    h = (hour12 % 12) + (pm ? 12 : 0);
  } else if (pm >= 0) {
    return std::nullopt; // meridiem without a 12-hour field
  }
  return civil_to_ms(Y, M, D, h, m, sec, 0);
}

std::string format_utc(std::int64_t ms, const char* fmt) {
  std::int64_t secs = ms / 1000;
  if (ms % 1000 < 0) --secs;
  std::time_t t = static_cast<std::time_t>(secs);
  std::tm tm{};
#if defined(_WIN32)
  gmtime_s(&tm, &t);
#else
  gmtime_r(&t, &tm);
#endif
  char buf[64];
  std::size_t n = std::strftime(buf, sizeof(buf), fmt, &tm);
  return std::string(buf, n);
}

}
