#include "chatpack/record_decoder.hpp"
#include "chatpack/date_parse.hpp"

#include <simdjson.h>
#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <regex>

namespace cp {

using simdjson::ondemand::json_type;

std::optional<std::uint64_t> parse_u64(std::string_view s) {
  if (s.empty() || s.size() > 20) return std::nullopt;
  std::uint64_t v = 0;
  for (char c : s) {
    if (c < '0' || c > '9') return std::nullopt;
    std::uint64_t d = static_cast<std::uint64_t>(c - '0');
    if (v > (UINT64_MAX - d) / 10) return std::nullopt;
    v = v * 10 + d;
  }
  return v;
}

std::string fix_mojibake(std::string_view s) {
  if (std::all_of(s.begin(), s.end(), [](char c){ return static_cast<unsigned char>(c) < 0x80; }))
    return std::string(s);

  // Every character must be U+0000..U+00FF, i.e. a 1-byte or a
  // 0xC2/0xC3-led 2-byte sequence.
  std::string bytes;
  bytes.reserve(s.size());
  for (std::size_t i = 0; i < s.size(); ++i) {
    unsigned char c = static_cast<unsigned char>(s[i]);
    if (c < 0x80) { bytes.push_back(static_cast<char>(c)); continue; }
    if ((c == 0xC2 || c == 0xC3) && i + 1 < s.size()) {
      unsigned char c2 = static_cast<unsigned char>(s[i+1]);
      if ((c2 & 0xC0) != 0x80) return std::string(s);
      bytes.push_back(static_cast<char>(((c & 0x1F) << 6) | (c2 & 0x3F)));
      ++i;
      continue;
    }
    return std::string(s);
  }
  if (!simdjson::validate_utf8(bytes.data(), bytes.size())) return std::string(s);
  return bytes;
}

namespace {

std::string_view get_str(simdjson::ondemand::value& v) {
  std::string_view s = v.get_string();
  return s;
}

bool is_null(simdjson::ondemand::value& v) {
  return v.type().value() == json_type::null;
}

// Numbers, or numbers quoted as strings (Discord snowflakes).
std::optional<std::uint64_t> get_opt_u64(simdjson::ondemand::value& v) {
  switch (v.type().value()) {
    case json_type::null:   return std::nullopt;
    case json_type::string: return parse_u64(get_str(v));
    default: {
      std::uint64_t x = v.get_uint64();
      return x;
    }
  }
}

std::optional<std::string> get_opt_string(simdjson::ondemand::value& v) {
  if (is_null(v)) return std::nullopt;
  return std::string(get_str(v));
}

// Telegram text: "plain" or ["run", {"type":"bold","text":"run"}, ...].
void append_telegram_text(simdjson::ondemand::value& v, std::string& out) {
  switch (v.type().value()) {
    case json_type::string: out.append(get_str(v)); break;
    case json_type::array:
      for (auto item : v.get_array()) {
        simdjson::ondemand::value el = item.value();
        auto t = el.type().value();
        if (t == json_type::string) {
          out.append(get_str(el));
        } else if (t == json_type::object) {
          simdjson::ondemand::object run = el.get_object();
          for (auto f : run) {
            std::string_view k = f.unescaped_key();
            if (k != "text") continue;
            simdjson::ondemand::value tv = f.value();
            if (tv.type().value() == json_type::string) out.append(get_str(tv));
          }
        }
      }
      break;
    default: break; // null or unexpected: no text
  }
}

}

struct JsonRecordDecoder::Impl {
  simdjson::ondemand::parser parser;
  std::string scratch;

  simdjson::padded_string_view pad(std::string_view text) {
    scratch.assign(text.data(), text.size());
    scratch.resize(text.size() + simdjson::SIMDJSON_PADDING, '\0');
    return simdjson::padded_string_view(scratch.data(), text.size(), scratch.capacity());
  }
};

JsonRecordDecoder::JsonRecordDecoder() : p_(new Impl) {}
JsonRecordDecoder::~JsonRecordDecoder() { delete p_; }

bool JsonRecordDecoder::decode_telegram(std::string_view text, TelegramRecord& out) {
  out = TelegramRecord{};
  bool has_type = false;
  try {
    auto doc = p_->parser.iterate(p_->pad(text));
    simdjson::ondemand::object obj = doc.get_object();
    for (auto field : obj) {
      std::string_view k = field.unescaped_key();
      simdjson::ondemand::value v = field.value();
      if (k == "type") {
        out.kind = std::string(get_str(v));
        has_type = true;
      } else if (k == "from") {
        out.from = get_opt_string(v);
      } else if (k == "text") {
        append_telegram_text(v, out.text);
      } else if (k == "date_unixtime") {
        if (!is_null(v)) out.date = parse_unix_seconds_ms(get_str(v));
      } else if (k == "edited_unixtime") {
        if (!is_null(v)) out.edited = parse_unix_seconds_ms(get_str(v));
      } else if (k == "id") {
        out.id = get_opt_u64(v);
      } else if (k == "reply_to_message_id") {
        out.reply_to = get_opt_u64(v);
      }
    }
  } catch (const std::exception& e) {
    err_ = e.what();
    return false;
  }
  if (!has_type) { err_ = "missing field `type`"; return false; }
  return true;
}

bool JsonRecordDecoder::decode_instagram(std::string_view text, InstagramRecord& out, bool fix_encoding) {
  out = InstagramRecord{};
  bool has_sender = false, has_ts = false;
  std::optional<std::string> content, share_text;
  try {
    auto doc = p_->parser.iterate(p_->pad(text));
    simdjson::ondemand::object obj = doc.get_object();
    for (auto field : obj) {
      std::string_view k = field.unescaped_key();
      simdjson::ondemand::value v = field.value();
      if (k == "sender_name") {
        out.sender = std::string(get_str(v));
        has_sender = true;
      } else if (k == "timestamp_ms") {
        std::int64_t ms = v.get_int64();
        out.timestamp = ms;
        has_ts = true;
      } else if (k == "content") {
        content = get_opt_string(v);
      } else if (k == "share") {
        if (is_null(v)) continue;
        simdjson::ondemand::object share = v.get_object();
        for (auto sf : share) {
          std::string_view sk = sf.unescaped_key();
          if (sk != "share_text") continue;
          simdjson::ondemand::value sv = sf.value();
          share_text = get_opt_string(sv);
        }
      }
    }
  } catch (const std::exception& e) {
    err_ = e.what();
    return false;
  }
  if (!has_sender) { err_ = "missing field `sender_name`"; return false; }
  if (!has_ts)     { err_ = "missing field `timestamp_ms`"; return false; }

  auto blank = [](const std::string& s){
    return std::all_of(s.begin(), s.end(), [](char c){ return std::isspace(static_cast<unsigned char>(c)) != 0; });
  };
  if (content && !blank(*content)) out.content = std::move(*content);
  else if (share_text) out.content = std::move(*share_text);

  if (fix_encoding) {
    out.sender = fix_mojibake(out.sender);
    out.content = fix_mojibake(out.content);
  }
  return true;
}

bool JsonRecordDecoder::decode_discord(std::string_view text, DiscordRecord& out, bool prefer_nickname) {
  out = DiscordRecord{};
  bool has_id = false, has_ts = false, has_content = false, has_author = false;
  std::string name, nickname;
  bool has_name = false;
  try {
    auto doc = p_->parser.iterate(p_->pad(text));
    simdjson::ondemand::object obj = doc.get_object();
    for (auto field : obj) {
      std::string_view k = field.unescaped_key();
      simdjson::ondemand::value v = field.value();
      if (k == "id") {
        out.id = get_opt_u64(v);
        has_id = true;
      } else if (k == "timestamp") {
        out.timestamp = parse_rfc3339_ms(get_str(v));
        has_ts = true;
      } else if (k == "timestampEdited") {
        if (!is_null(v)) out.edited = parse_rfc3339_ms(get_str(v));
      } else if (k == "content") {
        out.content = std::string(get_str(v));
        has_content = true;
      } else if (k == "author") {
        simdjson::ondemand::object author = v.get_object();
        for (auto af : author) {
          std::string_view ak = af.unescaped_key();
          simdjson::ondemand::value av = af.value();
          if (ak == "name") { name = std::string(get_str(av)); has_name = true; }
          else if (ak == "nickname") { if (!is_null(av)) nickname = std::string(get_str(av)); }
        }
        has_author = true;
      } else if (k == "reference") {
        if (is_null(v)) continue;
        simdjson::ondemand::object ref = v.get_object();
        for (auto rf : ref) {
          std::string_view rk = rf.unescaped_key();
          if (rk != "messageId") continue;
          simdjson::ondemand::value rv = rf.value();
          out.reply_to = get_opt_u64(rv);
        }
      } else if (k == "attachments" || k == "stickers") {
        if (is_null(v)) continue;
        const bool att = (k == "attachments");
        const std::string_view want = att ? "fileName" : "name";
        for (auto item : v.get_array()) {
          simdjson::ondemand::object o = item.get_object();
          bool found = false;
          for (auto f : o) {
            std::string_view fk = f.unescaped_key();
            if (fk != want) continue;
            simdjson::ondemand::value fv = f.value();
            (att ? out.attachments : out.stickers).emplace_back(get_str(fv));
            found = true;
          }
          if (!found) { err_ = std::string("missing field `") + std::string(want) + "`"; return false; }
        }
      }
    }
  } catch (const std::exception& e) {
    err_ = e.what();
    return false;
  }
  if (!has_id)      { err_ = "missing field `id`"; return false; }
  if (!has_ts)      { err_ = "missing field `timestamp`"; return false; }
  if (!has_content) { err_ = "missing field `content`"; return false; }
  if (!has_author || !has_name) { err_ = "missing field `author.name`"; return false; }
  out.sender = (!prefer_nickname || nickname.empty()) ? std::move(name) : std::move(nickname);
  return true;
}

std::optional<DiscordCsvColumns> DiscordCsvColumns::from_header(const std::vector<std::string>& header) {
  DiscordCsvColumns c;
  for (std::size_t i = 0; i < header.size(); ++i) {
    std::string h = header[i];
    // UTF-8 BOM on the first cell
    if (i == 0 && h.compare(0, 3, "\xEF\xBB\xBF") == 0) h.erase(0, 3);
    const int idx = static_cast<int>(i);
    if (h == "AuthorID") c.author_id = idx;
    else if (h == "Author") c.author = idx;
    else if (h == "Date") c.date = idx;
    else if (h == "Content") c.content = idx;
    else if (h == "Attachments") c.attachments = idx;
  }
  if (c.author < 0 || c.content < 0) return std::nullopt;
  return c;
}

bool decode_discord_csv(const std::vector<std::string>& row, const DiscordCsvColumns& cols,
                        DiscordRecord& out, std::string& err) {
  out = DiscordRecord{};
  auto cell = [&](int idx) -> const std::string* {
    if (idx < 0 || static_cast<std::size_t>(idx) >= row.size()) return nullptr;
    return &row[static_cast<std::size_t>(idx)];
  };
  const std::string* author = cell(cols.author);
  const std::string* content = cell(cols.content);
  if (!author || !content) {
    err = "row has " + std::to_string(row.size()) + " fields, expected Author and Content";
    return false;
  }
  out.sender = *author;
  out.content = *content;
  if (const std::string* date = cell(cols.date)) out.timestamp = parse_rfc3339_ms(*date);

  if (const std::string* atts = cell(cols.attachments)) {
    std::string_view rest(*atts);
    while (!rest.empty()) {
      std::size_t comma = rest.find(',');
      std::string_view url = rest.substr(0, comma);
      rest = (comma == std::string_view::npos) ? std::string_view{} : rest.substr(comma + 1);
      while (!url.empty() && std::isspace(static_cast<unsigned char>(url.front()))) url.remove_prefix(1);
      while (!url.empty() && std::isspace(static_cast<unsigned char>(url.back()))) url.remove_suffix(1);
      if (url.empty()) continue;
      std::string_view name = attachment_name(url);
      if (!name.empty()) out.attachments.emplace_back(name);
    }
  }
  return true;
}

std::string_view attachment_name(std::string_view item) {
  if (item.substr(0, 4) != "http") return item;
  std::size_t slash = item.rfind('/');
  return slash == std::string_view::npos ? item : item.substr(slash + 1);
}

bool match_discord_txt_header(std::string_view line, DiscordTxtHeader& out) {
  static const std::regex re(
    R"(^\[(\d{1,2}/\d{1,2}/\d{4}\s+\d{1,2}:\d{2}(?::\d{2})?\s*(?:[AP]M)?)\]\s+)",
    std::regex::ECMAScript | std::regex::optimize);
  static const char* const kTemplates[] = {
    "%m/%d/%Y %I:%M %p", "%m/%d/%Y %I:%M:%S %p",
    "%m/%d/%Y %H:%M",    "%m/%d/%Y %H:%M:%S",
  };

  const std::string_view head = line.substr(0, 64);
  std::match_results<std::string_view::const_iterator> m;
  if (!std::regex_search(head.begin(), head.end(), m, re, std::regex_constants::match_continuous))
    return false;

  std::string_view sender = line.substr(static_cast<std::size_t>(m.length(0)));
  while (!sender.empty() && std::isspace(static_cast<unsigned char>(sender.front()))) sender.remove_prefix(1);
  while (!sender.empty() && std::isspace(static_cast<unsigned char>(sender.back()))) sender.remove_suffix(1);
  if (sender.empty()) return false;

  std::string stamp(m[1].first, m[1].second);
  while (!stamp.empty() && std::isspace(static_cast<unsigned char>(stamp.back()))) stamp.pop_back();
  out.sender.assign(sender);
  out.timestamp.reset();
  for (const char* t : kTemplates) {
    if ((out.timestamp = parse_with_template(stamp, t))) break;
  }
  return true;
}

}
