#include "chatpack/stream_error.hpp"
#include <sstream>

namespace cp {

const char* error_kind_name(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::Io:                return "io";
    case ErrorKind::InvalidFormat:     return "invalid_format";
    case ErrorKind::SizeLimitExceeded: return "size_limit_exceeded";
    case ErrorKind::UnexpectedEof:     return "unexpected_eof";
    case ErrorKind::Decode:            return "decode";
  }
  return "unknown";
}

std::string StreamError::what() const {
  std::ostringstream o;
  switch (kind) {
    case ErrorKind::Io:            o << "I/O error"; break;
    case ErrorKind::InvalidFormat: o << "invalid format"; break;
    case ErrorKind::SizeLimitExceeded:
      o << "record size " << actual_size << " bytes exceeds limit of " << max_size << " bytes";
      break;
    case ErrorKind::UnexpectedEof: o << "unexpected end of input"; break;
    case ErrorKind::Decode:        o << "decode error"; break;
  }
  if (!detail.empty()) o << ": " << detail;
  if (record_index) o << " (record " << record_index << ")";
  return o.str();
}

StreamError StreamError::io(std::string detail) {
  StreamError e; e.kind = ErrorKind::Io; e.detail = std::move(detail); e.fatal = true;
  return e;
}

StreamError StreamError::invalid_format(std::string detail) {
  StreamError e; e.kind = ErrorKind::InvalidFormat; e.detail = std::move(detail); e.fatal = true;
  return e;
}

StreamError StreamError::size_limit(std::size_t max_size, std::size_t actual_size) {
  StreamError e; e.kind = ErrorKind::SizeLimitExceeded;
  e.max_size = max_size; e.actual_size = actual_size;
  return e;
}

StreamError StreamError::unexpected_eof(std::string detail) {
  StreamError e; e.kind = ErrorKind::UnexpectedEof; e.detail = std::move(detail);
  return e;
}

StreamError StreamError::decode(std::string detail) {
  StreamError e; e.kind = ErrorKind::Decode; e.detail = std::move(detail);
  return e;
}

}
