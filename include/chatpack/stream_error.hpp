#pragma once
#include "chatpack/message.hpp"
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <variant>

namespace cp {

enum class ErrorKind {
  Io,                 // open/read failure (fatal)
  InvalidFormat,      // array or grammar not found (fatal)
  SizeLimitExceeded,  // record larger than max_record_size
  UnexpectedEof,      // input ended inside a record
  Decode              // record text does not have the expected shape
};

const char* error_kind_name(ErrorKind k) noexcept;

struct StreamError {
  ErrorKind     kind = ErrorKind::Decode;
  std::string   detail;
  std::size_t   max_size = 0;       // SizeLimitExceeded only
  std::size_t   actual_size = 0;    // SizeLimitExceeded only
  bool          fatal = false;      // stream is finished after this error
  std::uint64_t record_index = 0;   // 1-based unit number, 0 if n/a

  std::string what() const;

  static StreamError io(std::string detail);
  static StreamError invalid_format(std::string detail);
  static StreamError size_limit(std::size_t max_size, std::size_t actual_size);
  static StreamError unexpected_eof(std::string detail);
  static StreamError decode(std::string detail);
};

// One pulled item: a message or a per-item error.
class StreamResult {
public:
  StreamResult(Message m) : v_(std::move(m)) {}
  StreamResult(StreamError e) : v_(std::move(e)) {}

  bool ok() const noexcept { return v_.index() == 0; }
  explicit operator bool() const noexcept { return ok(); }

  Message&           message()       { return std::get<Message>(v_); }
  const Message&     message() const { return std::get<Message>(v_); }
  const StreamError& error()   const { return std::get<StreamError>(v_); }

private:
  std::variant<Message, StreamError> v_;
};

}
