#include "chatpack/streams.hpp"
#include "chatpack/record_decoder.hpp"
#include "chatpack/record_scanner.hpp"

#include <memory>
#include <utility>

namespace cp {

struct ArrayMessageStream::Impl {
  std::unique_ptr<RecordScanner> scanner;
  JsonRecordDecoder decoder;
};

ArrayMessageStream::ArrayMessageStream(Platform platform, std::string path, StreamingConfig cfg)
  : MessageStream(platform, std::move(path), cfg), q_(new Impl) {}

ArrayMessageStream::~ArrayMessageStream() { delete q_; }

std::optional<StreamError> ArrayMessageStream::begin() {
  RecordScanner::Config sc;
  sc.max_record_size  = config().max_record_size;
  sc.locate_cap_bytes = config().locate_cap_bytes;
  sc.string_aware     = config().string_aware_scan;
  q_->scanner = std::make_unique<RecordScanner>(reader(), sc);
  if (!q_->scanner->locate()) return q_->scanner->error();
  return std::nullopt;
}

std::optional<MessageStream::Unit> ArrayMessageStream::advance() {
  std::string_view text;
  switch (q_->scanner->next_record(text)) {
    case RecordScanner::Status::End:    return std::nullopt;
    case RecordScanner::Status::Error:  return Unit{q_->scanner->error()};
    case RecordScanner::Status::Record: break;
  }

  JsonRecordDecoder& dec = q_->decoder;
  switch (platform()) {
    case Platform::Telegram: {
      TelegramRecord r;
      if (!dec.decode_telegram(text, r)) return Unit{StreamError::decode(dec.error())};
      return Unit{RawRecord{std::move(r)}};
    }
    case Platform::Instagram: {
      InstagramRecord r;
      if (!dec.decode_instagram(text, r, config().fix_encoding)) return Unit{StreamError::decode(dec.error())};
      return Unit{RawRecord{std::move(r)}};
    }
    case Platform::Discord: {
      DiscordRecord r;
      if (!dec.decode_discord(text, r, config().prefer_nickname)) return Unit{StreamError::decode(dec.error())};
      return Unit{RawRecord{std::move(r)}};
    }
    case Platform::WhatsApp:
      break;
  }
  return Unit{StreamError::invalid_format("platform has no JSON array layout")};
}

std::size_t ArrayMessageStream::peak_record_bytes() const noexcept {
  return q_->scanner ? q_->scanner->high_water() : 0;
}

std::uint64_t ArrayMessageStream::records_carved() const noexcept {
  return q_->scanner ? q_->scanner->records() : 0;
}

}
