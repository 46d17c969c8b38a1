#include "chatpack/whatsapp_format.hpp"
#include "chatpack/date_parse.hpp"
#include <algorithm>
#include <cctype>

namespace cp {

namespace {

const char* const kUsTemplates[] = {
  "%m/%d/%y, %I:%M:%S %p", "%m/%d/%y, %I:%M %p",
  "%m/%d/%Y, %I:%M:%S %p", "%m/%d/%Y, %I:%M %p",
  "%m/%d/%y, %H:%M:%S",    "%m/%d/%y, %H:%M",
  "%m/%d/%Y, %H:%M:%S",    "%m/%d/%Y, %H:%M",
};

const char* const kEuDotTemplates[] = {
  "%d.%m.%y, %H:%M:%S", "%d.%m.%y, %H:%M",
  "%d.%m.%Y, %H:%M:%S", "%d.%m.%Y, %H:%M",
};

const char* const kEuSlashTemplates[] = {
  "%d/%m/%y, %H:%M:%S", "%d/%m/%y, %H:%M",
  "%d/%m/%Y, %H:%M:%S", "%d/%m/%Y, %H:%M",
};

template <std::size_t N>
std::vector<const char*> list(const char* const (&a)[N]) { return std::vector<const char*>(a, a + N); }

std::vector<FormatDescriptor> build_descriptors() {
  const auto opts = std::regex::ECMAScript | std::regex::optimize;
  std::vector<FormatDescriptor> v;
  v.push_back({DateFormat::US, "us",
    std::regex(R"(^\[(\d{1,2}/\d{1,2}/\d{2,4}),\s(\d{1,2}:\d{2}(?::\d{2})?(?:\s?[APap][Mm])?)\]\s([^:]+):\s?)", opts),
    list(kUsTemplates)});
  v.push_back({DateFormat::EuDotBracketed, "eu_dot_bracketed",
    std::regex(R"(^\[(\d{2}\.\d{2}\.\d{2,4}),\s(\d{2}:\d{2}(?::\d{2})?)\]\s([^:]+):\s?)", opts),
    list(kEuDotTemplates)});
  v.push_back({DateFormat::EuDotNoBracket, "eu_dot",
    std::regex(R"(^(\d{2}\.\d{2}\.\d{2,4}),\s(\d{2}:\d{2}(?::\d{2})?)\s-\s([^:]+):\s?)", opts),
    list(kEuDotTemplates)});
  v.push_back({DateFormat::EuSlash, "eu_slash",
    std::regex(R"(^(\d{2}/\d{2}/\d{2,4}),\s(\d{2}:\d{2}(?::\d{2})?)\s-\s([^:]+):\s?)", opts),
    list(kEuSlashTemplates)});
  v.push_back({DateFormat::EuSlashBracketed, "eu_slash_bracketed",
    std::regex(R"(^\[(\d{2}/\d{2}/\d{2,4}),\s(\d{2}:\d{2}(?::\d{2})?)\]\s([^:]+):\s?)", opts),
    list(kEuSlashTemplates)});
  return v;
}

const std::vector<FormatDescriptor>& all_descriptors() {
  static const std::vector<FormatDescriptor> d = build_descriptors();
  return d;
}

const char* const kSystemEn[] = {
  "messages and calls are end-to-end encrypted",
  "created group",
  "added",
  "removed",
  "left",
  "changed the subject",
  "changed this group's icon",
  "changed the group description",
  "deleted this group's icon",
  "changed their phone number",
  "joined using this group's invite link",
  "security code changed",
  "you're now an admin",
  "is now an admin",
  "disappeared",
  "turned on disappearing messages",
  "turned off disappearing messages",
};

const char* const kSystemRu[] = {
  "Сообщения и звонки защищены сквозным шифрованием",
  "создал(а) группу",
  "добавил",
  "удалил",
  "вышел",
  "покинул",
  "изменил тему",
  "изменил иконку группы",
  "изменил описание группы",
  "удалил иконку группы",
  "изменил номер телефона",
  "присоединился по ссылке",
  "код безопасности изменён",
  "теперь администратор",
  "включил исчезающие сообщения",
  "выключил исчезающие сообщения",
  "Подробнее",
};

std::string ascii_lower(std::string_view s) {
  std::string out(s);
  for (auto& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return out;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

bool is_blank(std::string_view s) {
  return std::all_of(s.begin(), s.end(), [](char c){ return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

}

const FormatDescriptor& descriptor(DateFormat f) {
  return all_descriptors()[static_cast<std::size_t>(f)];
}

const char* date_format_name(DateFormat f) noexcept {
  switch (f) {
    case DateFormat::US:               return "us";
    case DateFormat::EuDotBracketed:   return "eu_dot_bracketed";
    case DateFormat::EuDotNoBracket:   return "eu_dot";
    case DateFormat::EuSlash:          return "eu_slash";
    case DateFormat::EuSlashBracketed: return "eu_slash_bracketed";
  }
  return "unknown";
}

const std::array<DateFormat, kDateFormatCount>& detection_priority() noexcept {
  static const std::array<DateFormat, kDateFormatCount> order = {
    DateFormat::US, DateFormat::EuDotBracketed, DateFormat::EuDotNoBracket,
    DateFormat::EuSlash, DateFormat::EuSlashBracketed,
  };
  return order;
}

std::array<FormatScore, kDateFormatCount> score_lines(const std::vector<std::string>& sample) {
  std::array<FormatScore, kDateFormatCount> scores{};
  std::size_t seen = 0;
  LineMatch m;
  for (const auto& raw : sample) {
    if (is_blank(raw)) continue;
    if (seen++ == kDetectSampleLines) break;
    const std::string line = clean_line(raw);
    for (const auto& d : all_descriptors()) {
      if (!match_line(d, line, m)) continue;
      auto& sc = scores[static_cast<std::size_t>(d.id)];
      ++sc.matches;
      if (parse_timestamp(d, m.date, m.time)) ++sc.parsed;
    }
  }
  return scores;
}

std::optional<DateFormat> detect_date_format(const std::vector<std::string>& sample) {
  const auto scores = score_lines(sample);
  std::optional<DateFormat> best;
  FormatScore top{};
  // strictly better only: earlier priority entries keep full ties
  for (DateFormat f : detection_priority()) {
    const FormatScore& s = scores[static_cast<std::size_t>(f)];
    if (s.matches == 0) continue;
    if (s.matches > top.matches || (s.matches == top.matches && s.parsed > top.parsed)) {
      best = f;
      top = s;
    }
  }
  return best;
}

bool match_line(const FormatDescriptor& f, std::string_view line, LineMatch& out) {
  // header grammar only; the body is taken from the full line afterwards
  const std::string_view head = line.substr(0, kHeaderScanLimit);
  std::match_results<std::string_view::const_iterator> m;
  if (!std::regex_search(head.begin(), head.end(), m, f.pattern, std::regex_constants::match_continuous))
    return false;
  out.date.assign(m[1].first, m[1].second);
  out.time.assign(m[2].first, m[2].second);
  out.sender.assign(trim(std::string_view(&*m[3].first, static_cast<std::size_t>(m[3].length()))));
  out.text.assign(line.substr(static_cast<std::size_t>(m.length(0))));
  return true;
}

std::string clean_line(std::string_view line) {
  static constexpr std::string_view kLrm = "\xE2\x80\x8E";   // U+200E
  static constexpr std::string_view kNnbsp = "\xE2\x80\xAF"; // U+202F
  while (line.substr(0, kLrm.size()) == kLrm) line.remove_prefix(kLrm.size());
  std::string out;
  out.reserve(line.size());
  for (std::size_t i = 0; i < line.size();) {
    if (line.compare(i, kNnbsp.size(), kNnbsp) == 0) { out.push_back(' '); i += kNnbsp.size(); }
    else out.push_back(line[i++]);
  }
  return out;
}

std::optional<std::int64_t> parse_timestamp(const FormatDescriptor& f,
                                            std::string_view date, std::string_view time) {
  std::string text;
  text.reserve(date.size() + time.size() + 2);
  text.append(date).append(", ").append(time);
  for (const char* t : f.templates) {
    if (auto ms = parse_with_template(text, t)) return ms;
  }
  return std::nullopt;
}

bool is_system_message(std::string_view sender, std::string_view content) {
  if (is_blank(sender)) return true;
  const std::string s = ascii_lower(sender);
  if (s.find("whatsapp") != std::string::npos || s.find("system") != std::string::npos) return true;

  const std::string c = ascii_lower(content);
  for (const char* p : kSystemEn) if (c.find(p) != std::string::npos) return true;
  for (const char* p : kSystemRu) if (content.find(p) != std::string_view::npos) return true;
  return false;
}

}
