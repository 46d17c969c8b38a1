#include "chatpack/message_stream.hpp"
#include "chatpack/chunk_reader.hpp"
#include "chatpack/normalizer.hpp"
#include "chatpack/streams.hpp"

#include <cstring>
#include <utility>

namespace cp {

struct MessageStream::Impl {
  Platform platform;
  std::string path;
  StreamingConfig cfg;
  ChunkReader reader;
  Normalizer normalizer;
  ProgressTracker progress;
  MetricsRegistry metrics;
  State state{State::NotStarted};
  std::uint64_t unit_index{0};

  Impl(Platform p, std::string file, StreamingConfig c)
    : platform(p), path(std::move(file)), cfg(c),
      reader(path, ChunkReader::Config{c.buffer_size, true}),
      normalizer(c.skip_system_messages, c.include_attachments) {}
};

MessageStream::MessageStream(Platform platform, std::string path, StreamingConfig cfg)
  : p_(new Impl(platform, std::move(path), cfg)) {}

MessageStream::~MessageStream() { delete p_; }

ChunkReader& MessageStream::reader() noexcept { return p_->reader; }

void MessageStream::finish() noexcept {
  p_->state = State::Finished;
  p_->progress.advance_to(p_->reader.bytes_read());
  p_->progress.finish();
  p_->metrics.set_bytes(p_->progress.bytes());
  p_->reader.close();
}

StreamResult MessageStream::fail(StreamError e) {
  e.fatal = true;
  p_->metrics.add_error(e.kind, false);
  finish();
  return StreamResult(std::move(e));
}

std::optional<StreamResult> MessageStream::next() {
  if (p_->state == State::Finished) return std::nullopt;

  if (p_->state == State::NotStarted) {
    p_->state = State::Preparing;
    if (!p_->reader.open()) {
      return fail(StreamError::io("cannot open " + p_->path + ": " +
                                  std::strerror(p_->reader.last_error())));
    }
    p_->progress.set_total(p_->reader.file_size());
    if (auto err = begin()) return fail(std::move(*err));
    p_->state = State::Active;
  }

  for (;;) {
    std::optional<Unit> unit = advance();
    p_->progress.advance_to(p_->reader.bytes_read());
    p_->metrics.set_bytes(p_->progress.bytes());
    if (!unit) { finish(); return std::nullopt; }

    if (auto* err = std::get_if<StreamError>(&*unit)) {
      if (err->fatal) return fail(std::move(*err));
      err->record_index = ++p_->unit_index;
      if (p_->cfg.skip_invalid) {
        p_->metrics.add_error(err->kind, true);
        continue;
      }
      p_->metrics.add_error(err->kind, false);
      return StreamResult(std::move(*err));
    }

    ++p_->unit_index;
    p_->metrics.add_unit();
    std::optional<Message> msg = p_->normalizer.normalize(std::get<RawRecord>(std::move(*unit)));
    if (!msg) { p_->metrics.add_dropped(); continue; }
    p_->metrics.add_message();
    p_->progress.add_items();
    return StreamResult(std::move(*msg));
  }
}

ProgressSnapshot MessageStream::progress() const noexcept { return p_->progress.snapshot(); }
bool MessageStream::progress_report_due() noexcept { return p_->progress.report_due(p_->cfg.progress_interval); }
MessageStream::State MessageStream::state() const noexcept { return p_->state; }
Platform MessageStream::platform() const noexcept { return p_->platform; }
const std::string& MessageStream::path() const noexcept { return p_->path; }
const StreamingConfig& MessageStream::config() const noexcept { return p_->cfg; }
const MetricsRegistry& MessageStream::metrics() const noexcept { return p_->metrics; }

std::unique_ptr<MessageStream> open_stream(Platform platform, std::string path, StreamingConfig cfg) {
  switch (platform) {
    case Platform::WhatsApp:
      return std::make_unique<WhatsAppStream>(std::move(path), cfg);
    case Platform::Discord:
      return std::make_unique<DiscordMessageStream>(std::move(path), cfg);
    case Platform::Telegram:
    case Platform::Instagram:
      break;
  }
  return std::make_unique<ArrayMessageStream>(platform, std::move(path), cfg);
}

}
