#include "chatpack/message_stream.hpp"
#include "chatpack/streams.hpp"
#include "../test_util.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using cp_test::check;
using cp_test::check_eq;

static const char* kTelegramWithBadRecord =
  "{\"name\": \"t\", \"messages\": [\n"
  "  {\"id\": 1, \"type\": \"message\", \"from\": \"A\", \"text\": \"one\"},\n"
  "  {\"id\": 2, \"from\": \"A\", \"text\": \"no type\"},\n"
  "  {\"id\": 3, \"type\": \"message\", \"from\": \"B\", \"text\": \"three\"}\n"
  "]}\n";

static void skip_vs_strict() {
  fs::path p = cp_test::write_temp("tg_bad_record.json", kTelegramWithBadRecord);
  {
    auto s = cp::open_stream(cp::Platform::Telegram, p.string());
    std::vector<std::string> got;
    while (auto r = s->next()) {
      check(r->ok(), "skip mode yields only messages");
      if (r->ok()) got.push_back(r->message().content);
    }
    check(got == std::vector<std::string>{"one", "three"}, "skip mode: bad record dropped");
    check_eq(s->metrics().errors_skipped(), std::uint64_t{1}, "skip mode: counted");
    check_eq(s->metrics().errors_of(cp::ErrorKind::Decode), std::uint64_t{1}, "skip mode: kind");
  }
  {
    cp::StreamingConfig cfg;
    cfg.skip_invalid = false;
    auto s = cp::open_stream(cp::Platform::Telegram, p.string(), cfg);
    auto a = s->next();
    check(a && a->ok() && a->message().content == "one", "strict: first message");
    auto b = s->next();
    if (check(b && !b->ok(), "strict: error surfaced")) {
      check(b->error().kind == cp::ErrorKind::Decode, "strict: decode error");
      check(!b->error().fatal, "strict: not fatal");
      check_eq(b->error().record_index, std::uint64_t{2}, "strict: record index");
    }
    auto c = s->next();
    check(c && c->ok() && c->message().content == "three", "strict: continues after error");
    check(!s->next().has_value(), "strict: end");
    check_eq(s->metrics().errors_surfaced(), std::uint64_t{1}, "strict: surfaced count");
  }
}

static void fatal_errors() {
  {
    auto s = cp::open_stream(cp::Platform::Telegram, "tests/data/does_not_exist.json");
    auto r = s->next();
    if (check(r && !r->ok(), "missing file: error")) {
      check(r->error().kind == cp::ErrorKind::Io, "missing file: io");
      check(r->error().fatal, "missing file: fatal");
    }
    check(!s->next().has_value(), "missing file: stream over");
    check(s->state() == cp::MessageStream::State::Finished, "missing file: finished");
  }
  {
    cp::StreamingConfig cfg;
    cfg.skip_invalid = true;   // fatal errors are never skipped
    auto s = cp::open_stream(cp::Platform::Telegram, "tests/data/bad_telegram_no_array.json", cfg);
    auto r = s->next();
    check(r && !r->ok() && r->error().kind == cp::ErrorKind::InvalidFormat, "no messages array: invalid format");
    check(!s->next().has_value(), "no messages array: stream over");
  }
  {
    auto s = cp::open_stream(cp::Platform::WhatsApp, "tests/data/bad_whatsapp_plain.txt");
    auto r = s->next();
    check(r && !r->ok() && r->error().kind == cp::ErrorKind::InvalidFormat, "no date grammar: invalid format");
  }
  {
    auto s = cp::open_stream(cp::Platform::Discord, "tests/data/bad_discord_header.csv");
    auto r = s->next();
    check(r && !r->ok() && r->error().kind == cp::ErrorKind::InvalidFormat, "csv header: invalid format");
  }
  {
    cp::StreamingConfig cfg;
    cfg.max_record_size = 16;
    auto s = cp::open_stream(cp::Platform::Telegram, "tests/data/telegram_basic.json", cfg);
    auto r = s->next();
    if (check(r && !r->ok(), "first record too large: error")) {
      check(r->error().kind == cp::ErrorKind::SizeLimitExceeded, "first record too large: kind");
      check(r->error().fatal, "first record too large: fatal");
      check_eq(r->error().max_size, std::size_t{16}, "first record too large: limit");
    }
    check(!s->next().has_value(), "first record too large: stream over");
  }
}

static void size_limits() {
  // later oversized objects are skipped, carving resumes after them
  std::string big(200, 'x');
  fs::path p = cp_test::write_temp("tg_big_record.json",
    "{\"messages\": [\n"
    "  {\"type\": \"message\", \"from\": \"A\", \"text\": \"one\"},\n"
    "  {\"type\": \"message\", \"from\": \"A\", \"text\": \"" + big + "\"},\n"
    "  {\"type\": \"message\", \"from\": \"B\", \"text\": \"two\"}\n"
    "]}\n");
  cp::StreamingConfig cfg;
  cfg.max_record_size = 100;
  cfg.skip_invalid = false;
  auto s = cp::open_stream(cp::Platform::Telegram, p.string(), cfg);
  std::vector<std::string> got;
  int size_errors = 0;
  while (auto r = s->next()) {
    if (r->ok()) got.push_back(r->message().content);
    else if (r->error().kind == cp::ErrorKind::SizeLimitExceeded && !r->error().fatal) ++size_errors;
  }
  check(got == std::vector<std::string>{"one", "two"}, "oversized object skipped");
  check_eq(size_errors, 1, "one size error");
  check(s->peak_record_bytes() <= 100, "record buffer stays under the limit");

  // WhatsApp: an oversized header line ends the record before it
  std::string line = "[1/15/24, 10:31:00 AM] Bob: " + std::string(80, 'y');
  fs::path w = cp_test::write_temp("wa_big_line.txt",
    "[1/15/24, 10:30:00 AM] Alice: short\n" + line + "\n"
    "tail of the big one\n"
    "[1/15/24, 10:32:00 AM] Alice: again\n");
  cp::StreamingConfig wc;
  wc.max_record_size = 48;
  wc.skip_invalid = false;
  auto ws = cp::open_stream(cp::Platform::WhatsApp, w.string(), wc);
  auto a = ws->next();
  check(a && a->ok() && a->message().content == "short", "whatsapp: record before oversized line");
  auto b = ws->next();
  if (check(b && !b->ok(), "whatsapp: size error")) {
    check(b->error().kind == cp::ErrorKind::SizeLimitExceeded, "whatsapp: size kind");
    check_eq(b->error().actual_size, line.size(), "whatsapp: full line length reported");
    check_eq(b->error().record_index, std::uint64_t{2}, "whatsapp: error index");
  }
  auto c = ws->next();
  check(c && c->ok() && c->message().content == "again", "whatsapp: continuation of oversized record dropped");
  check(!ws->next().has_value(), "whatsapp: end");
}

static void long_header_line() {
  // a single 1 MB message line is valid under the default record limit
  const std::string body(1024 * 1024, 'x');
  fs::path p = cp_test::write_temp("wa_long_line.txt",
    "[1/15/24, 10:30:00 AM] Alice: first\n"
    "[1/15/24, 10:31:00 AM] Bob: " + body + "\n"
    "[1/15/24, 10:32:00 AM] Alice: last\n");
  auto s = cp::open_stream(cp::Platform::WhatsApp, p.string());
  std::vector<cp::Message> got;
  int errors = 0;
  while (auto r = s->next()) {
    if (r->ok()) got.push_back(r->message());
    else ++errors;
  }
  check_eq(errors, 0, "long line: no errors");
  if (check_eq(got.size(), std::size_t{3}, "long line: three messages")) {
    check_eq(got[1].sender, std::string("Bob"), "long line: sender");
    check(got[1].content == body, "long line: full body kept");
    check_eq(got[2].content, std::string("last"), "long line: next record");
  }
}

static void truncated() {
  fs::path p = cp_test::write_temp("tg_truncated.json",
    "{\"messages\": [\n"
    "  {\"type\": \"message\", \"from\": \"A\", \"text\": \"one\"},\n"
    "  {\"type\": \"message\", \"from\": \"A\", \"te");
  cp::StreamingConfig cfg;
  cfg.skip_invalid = false;
  auto s = cp::open_stream(cp::Platform::Telegram, p.string(), cfg);
  auto a = s->next();
  check(a && a->ok(), "truncated: first message");
  auto b = s->next();
  check(b && !b->ok() && b->error().kind == cp::ErrorKind::UnexpectedEof, "truncated: unexpected eof");
  check(!s->next().has_value(), "truncated: end");
}

static void determinism() {
  const char* files[] = {"tests/data/telegram_basic.json", "tests/data/whatsapp_us.txt",
                         "tests/data/discord_export.csv"};
  const cp::Platform platforms[] = {cp::Platform::Telegram, cp::Platform::WhatsApp, cp::Platform::Discord};
  for (int i = 0; i < 3; ++i) {
    std::vector<cp::Message> first, second;
    for (auto* out : {&first, &second}) {
      cp::StreamingConfig cfg;
      cfg.buffer_size = i == 0 ? 7 : 64 * 1024;   // block boundaries must not matter
      auto s = cp::open_stream(platforms[i], files[i], cfg);
      while (auto r = s->next()) if (r->ok()) out->push_back(r->message());
    }
    check(!first.empty() && first == second, std::string("same messages on every pass: ") + files[i]);
  }

  std::vector<cp::Message> small, large;
  for (auto size : {std::size_t{5}, std::size_t{256 * 1024}}) {
    cp::StreamingConfig cfg;
    cfg.buffer_size = size;
    auto s = cp::open_stream(cp::Platform::Discord, "tests/data/discord_export.json", cfg);
    auto& out = size == 5 ? small : large;
    while (auto r = s->next()) if (r->ok()) out.push_back(r->message());
  }
  check(small.size() == 2 && small == large, "buffer size does not change the output");
}

static void progress() {
  cp::StreamingConfig cfg;
  cfg.progress_interval = 1;
  auto s = cp::open_stream(cp::Platform::WhatsApp, "tests/data/whatsapp_eu_slash.txt", cfg);
  check(s->state() == cp::MessageStream::State::NotStarted, "progress: lazy open");
  int due = 0;
  std::uint64_t last = 0;
  bool monotonic = true;
  while (auto r = s->next()) {
    check(s->state() == cp::MessageStream::State::Active, "progress: active while pulling");
    auto snap = s->progress();
    if (snap.bytes_processed < last) monotonic = false;
    last = snap.bytes_processed;
    if (s->progress_report_due()) ++due;
  }
  check(monotonic, "progress: bytes never decrease");
  check_eq(due, 3, "progress: one report per message");
  auto snap = s->progress();
  check(snap.total_bytes && *snap.total_bytes == fs::file_size("tests/data/whatsapp_eu_slash.txt"), "progress: total");
  check(snap.percentage() && *snap.percentage() == 100.0, "progress: complete");
  check_eq(snap.items_processed, std::uint64_t{3}, "progress: items");
}

int main(){
  if (!fs::exists("tests/data")) { std::cerr << "[ERR] run from the source directory\n"; return 2; }
  skip_vs_strict();
  fatal_errors();
  size_limits();
  long_header_line();
  truncated();
  determinism();
  progress();
  return cp_test::finish("stream_errors");
}
