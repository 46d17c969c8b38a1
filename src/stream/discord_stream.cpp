#include "chatpack/streams.hpp"
#include "chatpack/chunk_reader.hpp"
#include "chatpack/csv_fsm.hpp"
#include "chatpack/path_utils.hpp"
#include "chatpack/record_decoder.hpp"
#include "chatpack/record_scanner.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <memory>
#include <utility>

namespace cp {

namespace {

constexpr std::string_view kBom = "\xEF\xBB\xBF";

bool blank(std::string_view s) {
  return std::all_of(s.begin(), s.end(), [](char c){ return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

std::string_view strip_bom(std::string_view s) {
  if (s.substr(0, kBom.size()) == kBom) s.remove_prefix(kBom.size());
  return s;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
  while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.remove_suffix(1);
  return s;
}

StreamError read_error(const ChunkReader& r) {
  return StreamError::io(std::string("read failed: ") + std::strerror(r.last_error()));
}

// Where continuation lines of a TXT message go.
enum class TxtSection { Text, Attachments, Stickers };

}

struct DiscordMessageStream::Impl {
  std::optional<Layout> layout;
  std::unique_ptr<RecordScanner> scanner;
  JsonRecordDecoder decoder;
  std::unique_ptr<CsvFsm> csv;
  DiscordCsvColumns cols;
  std::string line;
  std::uint64_t line_no{0};
  std::size_t peak{0};

  // TXT layout
  std::optional<DiscordRecord> cur;
  std::size_t cur_bytes{0};
  TxtSection section{TxtSection::Text};
  bool drop_continuations{false};
  std::optional<StreamError> pending_err;
};

DiscordMessageStream::DiscordMessageStream(std::string path, StreamingConfig cfg)
  : MessageStream(Platform::Discord, std::move(path), cfg), q_(new Impl) {}

DiscordMessageStream::~DiscordMessageStream() { delete q_; }

std::optional<StreamError> DiscordMessageStream::begin() {
  const std::size_t max = config().max_record_size;

  switch (detect_format(path())) {
    case FileFormat::JSONL: q_->layout = Layout::Jsonl; break;
    case FileFormat::CSV:   q_->layout = Layout::Csv; break;
    case FileFormat::Text:  q_->layout = Layout::Txt; break;
    default: {
      // sniff the first non-blank line, then start over
      bool oversize = false;
      bool got = false;
      while (reader().read_line(q_->line, max, oversize)) {
        if (!blank(q_->line)) { got = true; break; }
      }
      if (reader().failed()) return read_error(reader());
      const std::string_view first = trim(strip_bom(q_->line));
      // a whole object on the first line; pretty-printed JSON opens with a bare "{"
      const bool jsonl = got && first.size() >= 2 && first.front() == '{' && first.back() == '}' &&
                         first.find("\"messages\"") == std::string_view::npos &&
                         first.find("\"guild\"") == std::string_view::npos;
      DiscordTxtHeader h;
      // TXT exports open with a "=====" banner or go straight to a message header
      const bool txt = got && (first.substr(0, 3) == "===" || match_discord_txt_header(first, h));
      q_->layout = jsonl ? Layout::Jsonl : txt ? Layout::Txt : Layout::Json;
      q_->line.clear();
      if (!reader().rewind()) return read_error(reader());
      break;
    }
  }

  if (*q_->layout == Layout::Json) {
    RecordScanner::Config sc;
    sc.max_record_size  = max;
    sc.locate_cap_bytes = config().locate_cap_bytes;
    sc.string_aware     = config().string_aware_scan;
    q_->scanner = std::make_unique<RecordScanner>(reader(), sc);
    if (!q_->scanner->locate()) return q_->scanner->error();
    return std::nullopt;
  }

  if (*q_->layout == Layout::Csv) {
    q_->csv = std::make_unique<CsvFsm>(CsvConfig{});
    bool oversize = false;
    while (q_->csv->header().empty()) {
      if (!reader().read_line(q_->line, max, oversize)) {
        if (reader().failed()) return read_error(reader());
        return StreamError::invalid_format("CSV header row missing");
      }
      if (oversize) return StreamError::invalid_format("CSV header row exceeds max record size");
      if (!q_->csv->feed(q_->line, [](const std::vector<std::string>&){}))
        return StreamError::invalid_format(q_->csv->error());
    }
    auto cols = DiscordCsvColumns::from_header(q_->csv->header());
    if (!cols) return StreamError::invalid_format("CSV header lacks Author/Content columns");
    q_->cols = *cols;
  }
  return std::nullopt;
}

std::optional<MessageStream::Unit> DiscordMessageStream::advance() {
  const std::size_t max = config().max_record_size;
  JsonRecordDecoder& dec = q_->decoder;

  if (*q_->layout == Layout::Json) {
    std::string_view text;
    switch (q_->scanner->next_record(text)) {
      case RecordScanner::Status::End:    return std::nullopt;
      case RecordScanner::Status::Error:  return Unit{q_->scanner->error()};
      case RecordScanner::Status::Record: break;
    }
    DiscordRecord r;
    if (!dec.decode_discord(text, r, config().prefer_nickname)) return Unit{StreamError::decode(dec.error())};
    return Unit{RawRecord{std::move(r)}};
  }

  if (*q_->layout == Layout::Txt) return advance_txt();

  if (*q_->layout == Layout::Jsonl) {
    for (;;) {
      bool oversize = false;
      std::uint64_t n = 0;
      if (!reader().read_line(q_->line, max, oversize, &n)) {
        if (reader().failed()) { StreamError e = read_error(reader()); return Unit{std::move(e)}; }
        return std::nullopt;
      }
      ++q_->line_no;
      if (oversize) return Unit{StreamError::size_limit(max, static_cast<std::size_t>(n))};
      std::string_view text = q_->line_no == 1 ? strip_bom(q_->line) : std::string_view(q_->line);
      if (blank(text)) continue;
      q_->peak = std::max(q_->peak, text.size());
      DiscordRecord r;
      if (!dec.decode_discord(text, r, config().prefer_nickname))
        return Unit{StreamError::decode("line " + std::to_string(q_->line_no) + ": " + dec.error())};
      return Unit{RawRecord{std::move(r)}};
    }
  }

  // CSV
  CsvFsm& csv = *q_->csv;
  for (;;) {
    bool oversize = false;
    std::uint64_t n = 0;
    if (!reader().read_line(q_->line, max, oversize, &n)) {
      if (reader().failed()) { StreamError e = read_error(reader()); return Unit{std::move(e)}; }
      if (!csv.finish()) return Unit{StreamError::unexpected_eof(csv.error())};
      return std::nullopt;
    }
    if (oversize) {
      const std::size_t actual = csv.pending_bytes() + static_cast<std::size_t>(n);
      csv.discard_record();
      // keeps quote tracking in step with the dropped line; a quoting
      // error only ends the dropped record early
      (void)csv.feed(q_->line, [](const std::vector<std::string>&){});
      return Unit{StreamError::size_limit(max, actual)};
    }

    std::vector<std::string> row;
    bool got = false;
    if (!csv.feed(q_->line, [&](const std::vector<std::string>& f){ row = f; got = true; }))
      return Unit{StreamError::decode(csv.error())};

    if (got) {
      std::size_t bytes = 0;
      for (const auto& f : row) bytes += f.size();
      if (bytes > max) return Unit{StreamError::size_limit(max, bytes)};
      q_->peak = std::max(q_->peak, bytes);
      DiscordRecord r;
      std::string err;
      if (!decode_discord_csv(row, q_->cols, r, err)) return Unit{StreamError::decode(err)};
      return Unit{RawRecord{std::move(r)}};
    }
    if (csv.in_record() && csv.pending_bytes() > max) {
      const std::size_t actual = csv.pending_bytes();
      csv.discard_record();
      return Unit{StreamError::size_limit(max, actual)};
    }
  }
}

// "[date time] sender" opens a message; following lines are its text
// until "{Attachments}" or "{Stickers}" switch the section. Lines before
// the first header (the export banner) are dropped.
std::optional<MessageStream::Unit> DiscordMessageStream::advance_txt() {
  const std::size_t max = config().max_record_size;
  Impl& s = *q_;

  if (s.pending_err) {
    StreamError e = std::move(*s.pending_err);
    s.pending_err.reset();
    return Unit{std::move(e)};
  }

  auto flush = [&s]() {
    DiscordRecord done = std::move(*s.cur);
    s.cur.reset();
    done.content = std::string(trim(done.content));
    return Unit{RawRecord{std::move(done)}};
  };

  for (;;) {
    bool oversize = false;
    std::uint64_t n = 0;
    if (!reader().read_line(s.line, max, oversize, &n)) {
      if (reader().failed()) { StreamError e = read_error(reader()); return Unit{std::move(e)}; }
      if (s.cur) return flush();
      return std::nullopt;
    }
    ++s.line_no;
    const std::string_view text = s.line_no == 1 ? strip_bom(s.line) : std::string_view(s.line);
    DiscordTxtHeader h;
    const bool header = match_discord_txt_header(text, h);

    if (oversize) {
      StreamError e = StreamError::size_limit(max, static_cast<std::size_t>(n));
      s.drop_continuations = true;
      if (header && s.cur) {
        s.pending_err = std::move(e);
        return flush();
      }
      s.cur.reset();
      return Unit{std::move(e)};
    }

    if (header) {
      DiscordRecord next;
      next.sender = std::move(h.sender);
      next.timestamp = h.timestamp;
      s.section = TxtSection::Text;
      s.drop_continuations = false;
      s.cur_bytes = 0;
      if (s.cur) {
        Unit done = flush();
        s.cur = std::move(next);
        return done;
      }
      s.cur = std::move(next);
      continue;
    }

    if (s.drop_continuations || !s.cur) continue;
    if (text == "{Attachments}") { s.section = TxtSection::Attachments; continue; }
    if (text == "{Stickers}")    { s.section = TxtSection::Stickers; continue; }

    const std::string_view item = s.section == TxtSection::Text ? text : attachment_name(trim(text));
    if (s.section != TxtSection::Text && item.empty()) continue;
    s.cur_bytes += item.size() + 1;
    if (s.cur_bytes > max) {
      const std::size_t actual = s.cur_bytes;
      s.cur.reset();
      s.drop_continuations = true;
      return Unit{StreamError::size_limit(max, actual)};
    }
    s.peak = std::max(s.peak, s.cur_bytes);

    switch (s.section) {
      case TxtSection::Text:
        if (!s.cur->content.empty()) s.cur->content.push_back('\n');
        s.cur->content.append(text);
        break;
      case TxtSection::Attachments: s.cur->attachments.emplace_back(item); break;
      case TxtSection::Stickers:    s.cur->stickers.emplace_back(item); break;
    }
  }
}

std::size_t DiscordMessageStream::peak_record_bytes() const noexcept {
  if (q_->scanner) return q_->scanner->high_water();
  return q_->peak;
}

std::optional<DiscordMessageStream::Layout> DiscordMessageStream::layout() const noexcept {
  return q_->layout;
}

}
