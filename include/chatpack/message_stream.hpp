#pragma once
#include "chatpack/message.hpp"
#include "chatpack/metrics.hpp"
#include "chatpack/platform.hpp"
#include "chatpack/progress.hpp"
#include "chatpack/raw_record.hpp"
#include "chatpack/stream_error.hpp"
#include "chatpack/streaming_config.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <variant>

namespace cp {

class ChunkReader;

// Pull-based stream of messages from one export file.
//
//   NotStarted -> Preparing (open, locate array / detect grammar) -> Active -> Finished
//
// next() returns a Message, a StreamError, or nullopt once Finished.
// Fatal errors (Io, InvalidFormat, size limit on the first record) are
// returned once and finish the stream. Per-record errors are dropped when
// skip_invalid is set; otherwise they are returned and the following call
// continues with the next record.
class MessageStream {
public:
  enum class State { NotStarted, Preparing, Active, Finished };

  virtual ~MessageStream();

  MessageStream(const MessageStream&) = delete;
  MessageStream& operator=(const MessageStream&) = delete;

  std::optional<StreamResult> next();

  ProgressSnapshot progress() const noexcept;
  // True once every config().progress_interval emitted messages.
  bool progress_report_due() noexcept;

  State state() const noexcept;
  Platform platform() const noexcept;
  const std::string& path() const noexcept;
  const StreamingConfig& config() const noexcept;
  const MetricsRegistry& metrics() const noexcept;

  // Largest record text held in memory so far.
  virtual std::size_t peak_record_bytes() const noexcept = 0;

protected:
  using Unit = std::variant<RawRecord, StreamError>;

  MessageStream(Platform platform, std::string path, StreamingConfig cfg);

  ChunkReader& reader() noexcept;

  // Called once after the file is open. An error returned here is fatal.
  virtual std::optional<StreamError> begin() = 0;

  // Next decoded record or per-record error; nullopt at end of input.
  virtual std::optional<Unit> advance() = 0;

private:
  StreamResult fail(StreamError e);
  void finish() noexcept;

  struct Impl; Impl* p_;
};

// Chooses the stream for `platform`. No I/O happens before the first next().
std::unique_ptr<MessageStream> open_stream(Platform platform, std::string path,
                                           StreamingConfig cfg = StreamingConfig{});

}
