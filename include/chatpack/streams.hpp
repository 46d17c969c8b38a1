#pragma once
#include "chatpack/message_stream.hpp"
#include "chatpack/whatsapp_format.hpp"
#include <cstdint>
#include <optional>

namespace cp {

// Telegram, Instagram and Discord JSON exports: objects of the top-level
// "messages" array, carved one at a time by RecordScanner.
class ArrayMessageStream : public MessageStream {
public:
  ArrayMessageStream(Platform platform, std::string path, StreamingConfig cfg = StreamingConfig{});
  ~ArrayMessageStream() override;

  std::size_t peak_record_bytes() const noexcept override;
  std::uint64_t records_carved() const noexcept;

protected:
  std::optional<StreamError> begin() override;
  std::optional<Unit> advance() override;

private:
  struct Impl; Impl* q_;
};

// Discord exports in any of the DiscordChatExporter layouts. The layout
// comes from the extension, else from the first non-blank line.
class DiscordMessageStream : public MessageStream {
public:
  enum class Layout { Json, Jsonl, Csv, Txt };

  DiscordMessageStream(std::string path, StreamingConfig cfg = StreamingConfig{});
  ~DiscordMessageStream() override;

  std::size_t peak_record_bytes() const noexcept override;
  std::optional<Layout> layout() const noexcept;   // known after the first next()

protected:
  std::optional<StreamError> begin() override;
  std::optional<Unit> advance() override;

private:
  std::optional<Unit> advance_txt();

  struct Impl; Impl* q_;
};

// WhatsApp text exports. The first lines are sampled to pick the date
// grammar, then replayed.
class WhatsAppStream : public MessageStream {
public:
  WhatsAppStream(std::string path, StreamingConfig cfg = StreamingConfig{});
  ~WhatsAppStream() override;

  std::size_t peak_record_bytes() const noexcept override;
  std::optional<DateFormat> detected_format() const noexcept;   // known after the first next()

protected:
  std::optional<StreamError> begin() override;
  std::optional<Unit> advance() override;

private:
  struct Impl; Impl* q_;
};

}
