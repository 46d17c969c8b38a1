#include "chatpack/streams.hpp"
#include "chatpack/chunk_reader.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <deque>
#include <utility>

namespace cp {

namespace {

struct Line {
  std::string text;
  bool oversize = false;
  std::uint64_t size = 0;
};

bool blank(std::string_view s) {
  return std::all_of(s.begin(), s.end(), [](char c){ return std::isspace(static_cast<unsigned char>(c)) != 0; });
}

}

struct WhatsAppStream::Impl {
  std::optional<DateFormat> format;
  const FormatDescriptor* desc{nullptr};
  std::deque<Line> replay;                 // lines read while sampling
  std::optional<WhatsAppRecord> cur;       // record being assembled
  std::optional<StreamError> pending_err;  // reported after flushing `cur`
  bool drop_continuations{false};
  LineMatch m;
  std::size_t peak{0};
};

WhatsAppStream::WhatsAppStream(std::string path, StreamingConfig cfg)
  : MessageStream(Platform::WhatsApp, std::move(path), cfg), q_(new Impl) {}

WhatsAppStream::~WhatsAppStream() { delete q_; }

std::optional<StreamError> WhatsAppStream::begin() {
  const std::size_t max = config().max_record_size;
  std::vector<std::string> sample;
  std::uint64_t scanned = 0;
  bool first = true;

  while (sample.size() < kDetectSampleLines && scanned <= config().locate_cap_bytes) {
    Line l;
    if (!reader().read_line(l.text, max, l.oversize, &l.size)) break;
    if (first) {
      if (l.text.compare(0, 3, "\xEF\xBB\xBF") == 0) l.text.erase(0, 3);
      first = false;
    }
    scanned += l.size + 1;
    if (!l.oversize && !blank(l.text)) sample.push_back(l.text);
    q_->replay.push_back(std::move(l));
  }
  if (reader().failed())
    return StreamError::io(std::string("read failed: ") + std::strerror(reader().last_error()));

  q_->format = detect_date_format(sample);
  if (!q_->format)
    return StreamError::invalid_format("no WhatsApp date format matches the first " +
                                       std::to_string(sample.size()) + " lines");
  q_->desc = &descriptor(*q_->format);
  return std::nullopt;
}

std::optional<MessageStream::Unit> WhatsAppStream::advance() {
  const std::size_t max = config().max_record_size;
  Impl& s = *q_;

  if (s.pending_err) {
    StreamError e = std::move(*s.pending_err);
    s.pending_err.reset();
    return Unit{std::move(e)};
  }

  auto flush = [&s]() {
    WhatsAppRecord done = std::move(*s.cur);
    s.cur.reset();
    return Unit{RawRecord{std::move(done)}};
  };

  for (;;) {
    Line l;
    if (!s.replay.empty()) {
      l = std::move(s.replay.front());
      s.replay.pop_front();
    } else if (!reader().read_line(l.text, max, l.oversize, &l.size)) {
      if (reader().failed())
        return Unit{StreamError::io(std::string("read failed: ") + std::strerror(reader().last_error()))};
      if (s.cur) return flush();
      return std::nullopt;
    }

    const std::string text = clean_line(l.text);
    const bool header = match_line(*s.desc, text, s.m);

    if (l.oversize) {
      StreamError e = StreamError::size_limit(max, static_cast<std::size_t>(l.size));
      s.drop_continuations = true;
      if (header && s.cur) {
        // the previous record is complete; report the oversized one next
        s.pending_err = std::move(e);
        return flush();
      }
      s.cur.reset();
      return Unit{std::move(e)};
    }

    if (header) {
      WhatsAppRecord next;
      next.sender = std::move(s.m.sender);
      next.content = std::move(s.m.text);
      next.timestamp = parse_timestamp(*s.desc, s.m.date, s.m.time);
      s.drop_continuations = false;
      s.peak = std::max(s.peak, next.content.size());
      if (s.cur) {
        Unit done = flush();
        s.cur = std::move(next);
        return done;
      }
      s.cur = std::move(next);
      continue;
    }

    // continuation line; orphans before the first record are dropped
    if (s.drop_continuations || !s.cur) continue;
    const std::size_t grown = s.cur->content.size() + 1 + l.text.size();
    if (grown > max) {
      s.cur.reset();
      s.drop_continuations = true;
      return Unit{StreamError::size_limit(max, grown)};
    }
    s.cur->content.push_back('\n');
    s.cur->content.append(l.text);
    s.peak = std::max(s.peak, s.cur->content.size());
  }
}

std::size_t WhatsAppStream::peak_record_bytes() const noexcept { return q_->peak; }

std::optional<DateFormat> WhatsAppStream::detected_format() const noexcept { return q_->format; }

}
