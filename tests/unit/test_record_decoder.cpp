#include "chatpack/record_decoder.hpp"
#include "../test_util.hpp"
#include <string>
#include <vector>

using cp_test::check;
using cp_test::check_eq;

static const char* kMojibakePrivet =
  "\\u00d0\\u009f\\u00d1\\u0080\\u00d0\\u00b8\\u00d0\\u00b2\\u00d0\\u00b5\\u00d1\\u0082";

int main(){
  cp::JsonRecordDecoder dec;

  // Telegram
  {
    cp::TelegramRecord r;
    const std::string j = R"({"id": 7, "type": "message", "date": "2024-01-15T10:30:00",)"
                          R"( "date_unixtime": "1705314600", "from": "Alice",)"
                          R"( "text": ["Hello ", {"type": "bold", "text": "world"}, "!"],)"
                          R"( "reply_to_message_id": 5, "edited_unixtime": "1705314660"})";
    if (check(dec.decode_telegram(j, r), "telegram rich text")) {
      check_eq(r.kind, std::string("message"), "type");
      check(r.from && *r.from == "Alice", "from");
      check_eq(r.text, std::string("Hello world!"), "runs concatenated");
      check(r.id && *r.id == 7u, "id");
      check(r.reply_to && *r.reply_to == 5u, "reply_to");
      check(r.date && *r.date == 1705314600000LL, "date_unixtime");
      check(r.edited && *r.edited == 1705314660000LL, "edited_unixtime");
    }
    check(dec.decode_telegram(R"({"type": "service", "from": null, "text": ""})", r), "service record");
    check(!r.from.has_value(), "null from");
    check(!dec.decode_telegram(R"({"id": 1, "text": "no type"})", r), "missing type");
    check(dec.error().find("type") != std::string::npos, "missing type message");
    check(!dec.decode_telegram("[1, 2]", r), "not an object");
    check(!dec.error().empty(), "parse error message");
  }

  // Discord JSON
  {
    cp::DiscordRecord r;
    const std::string j = R"({"id": "1100000000000000001", "type": "Default",)"
                          R"( "timestamp": "2024-01-15T10:30:00+00:00", "timestampEdited": null,)"
                          R"( "content": "hey", "author": {"id": "42", "name": "alice", "nickname": "Alice"},)"
                          R"( "attachments": [{"id": "1", "url": "https://cdn/x/photo.jpg", "fileName": "photo.jpg"}],)"
                          R"( "stickers": [{"id": "2", "name": "wave"}],)"
                          R"( "reference": {"messageId": "1099999999999999999", "channelId": "9"}})";
    if (check(dec.decode_discord(j, r), "discord message")) {
      check(r.id && *r.id == 1100000000000000001ULL, "snowflake id");
      check_eq(r.sender, std::string("Alice"), "nickname preferred");
      check_eq(r.content, std::string("hey"), "content");
      check(r.timestamp && *r.timestamp == 1705314600000LL, "timestamp");
      check(!r.edited.has_value(), "null edited");
      check(r.reply_to && *r.reply_to == 1099999999999999999ULL, "reference");
      check(r.attachments.size() == 1 && r.attachments[0] == "photo.jpg", "attachment file name");
      check(r.stickers.size() == 1 && r.stickers[0] == "wave", "sticker name");
    }
    const std::string k = R"({"id": "1", "timestamp": "2024-01-15T10:30:00Z", "content": "",)"
                          R"( "author": {"name": "bob", "nickname": ""}})";
    if (check(dec.decode_discord(j, r, false), "discord account name"))
      check_eq(r.sender, std::string("alice"), "nickname ignored when not preferred");
    if (check(dec.decode_discord(k, r), "discord minimal"))
      check_eq(r.sender, std::string("bob"), "empty nickname falls back to name");
    check(!dec.decode_discord(R"({"id": "1", "timestamp": "2024-01-15T10:30:00Z", "author": {"name": "a"}})", r),
          "missing content");
    check(dec.error().find("content") != std::string::npos, "missing content message");
    check(!dec.decode_discord(R"({"id": "1", "timestamp": "2024-01-15T10:30:00Z", "content": "x", "author": {"nickname": "a"}})", r),
          "missing author name");
    check(!dec.decode_discord(R"({"id": "1", "timestamp": "2024-01-15T10:30:00Z", "content": "x", "author": {"name": "a"},)"
                              R"( "attachments": [{"url": "u"}]})", r), "attachment without fileName");
  }

  // Discord TXT headers
  {
    cp::DiscordTxtHeader h;
    if (check(cp::match_discord_txt_header("[1/15/2024 10:30 AM] alice", h), "txt header 12h")) {
      check_eq(h.sender, std::string("alice"), "txt sender");
      check(h.timestamp && *h.timestamp == 1705314600000LL, "txt timestamp");
    }
    if (check(cp::match_discord_txt_header("[12/31/2024 11:59 PM]  Bob Smith ", h), "txt header padded sender"))
      check_eq(h.sender, std::string("Bob Smith"), "txt sender trimmed");
    if (check(cp::match_discord_txt_header("[1/15/2024 18:30:05] carol", h), "txt header 24h"))
      check(h.timestamp && *h.timestamp == 1705314600000LL + 8 * 3600000LL + 5000, "txt 24h timestamp");
    check(!cp::match_discord_txt_header("[1/15/2024 10:30 AM]", h), "txt header without sender");
    check(!cp::match_discord_txt_header("[15.01.2024 10:30] x", h), "dotted date is not a txt header");
    check(!cp::match_discord_txt_header("hello", h), "plain line");
    check(cp::attachment_name("https://cdn.discordapp.com/attachments/1/2/photo.jpg") == "photo.jpg", "url to file name");
    check(cp::attachment_name("notes.txt") == "notes.txt", "bare name kept");
  }

  // Instagram
  {
    cp::InstagramRecord r;
    const std::string j = std::string(R"({"sender_name": ")") + kMojibakePrivet +
                          R"(", "timestamp_ms": 1705314600000, "content": ")" + kMojibakePrivet + R"("})";
    if (check(dec.decode_instagram(j, r, true), "instagram mojibake")) {
      check_eq(r.sender, std::string("Привет"), "sender repaired");
      check_eq(r.content, std::string("Привет"), "content repaired");
      check(r.timestamp && *r.timestamp == 1705314600000LL, "timestamp_ms");
    }
    if (check(dec.decode_instagram(j, r, false), "instagram raw"))
      check(r.content != "Привет", "no repair when disabled");

    const std::string s = R"({"sender_name": "a", "timestamp_ms": 1, "content": "  ", "share": {"link": "l", "share_text": "shared"}})";
    if (check(dec.decode_instagram(s, r, true), "instagram share"))
      check_eq(r.content, std::string("shared"), "blank content uses share_text");
    check(!dec.decode_instagram(R"({"sender_name": "a", "content": "x"})", r, true), "missing timestamp_ms");
    check(!dec.decode_instagram(R"({"timestamp_ms": 1})", r, true), "missing sender_name");
  }

  // mojibake repair is conservative
  check_eq(cp::fix_mojibake("plain ascii"), std::string("plain ascii"), "ascii unchanged");
  check_eq(cp::fix_mojibake("Привет"), std::string("Привет"), "real cyrillic unchanged");
  check_eq(cp::fix_mojibake("caf\xC3\xA9"), std::string("caf\xC3\xA9"), "latin-1 text that is not utf-8 stays");

  // Discord CSV rows
  {
    std::vector<std::string> header = {"\xEF\xBB\xBF" "AuthorID", "Author", "Date", "Content", "Attachments", "Reactions"};
    auto cols = cp::DiscordCsvColumns::from_header(header);
    if (check(cols.has_value(), "csv header")) {
      check_eq(cols->author_id, 0, "BOM stripped from first column");
      cp::DiscordRecord r;
      std::string err;
      std::vector<std::string> row = {"42", "alice", "2024-01-15T10:30:00.000+00:00", "multi\nline",
                                      "https://cdn/a/photo.jpg, https://cdn/b/doc.pdf", ""};
      if (check(cp::decode_discord_csv(row, *cols, r, err), "csv row")) {
        check_eq(r.sender, std::string("alice"), "csv author");
        check_eq(r.content, std::string("multi\nline"), "csv content");
        check(r.timestamp && *r.timestamp == 1705314600000LL, "csv date");
        check(r.attachments.size() == 2 && r.attachments[0] == "photo.jpg" && r.attachments[1] == "doc.pdf",
              "attachment urls reduced to names");
      }
      check(!cp::decode_discord_csv({"42", "alice"}, *cols, r, err), "short row");
      check(!err.empty(), "short row message");
    }
    check(!cp::DiscordCsvColumns::from_header({"Author", "Date"}).has_value(), "header without Content");
  }

  check(cp::parse_u64("18446744073709551615").has_value(), "u64 max");
  check(!cp::parse_u64("18446744073709551616").has_value(), "u64 overflow");
  check(!cp::parse_u64("").has_value(), "empty u64");
  check(!cp::parse_u64(" 1").has_value(), "leading space");

  return cp_test::finish("record_decoder");
}
