#pragma once
#include "chatpack/message.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace cp {

enum class OutputFormat { Csv, Json, Jsonl };

const char* output_format_name(OutputFormat f) noexcept;
std::optional<OutputFormat> parse_output_format(std::string_view s);
// From the file extension (.csv, .json, .jsonl, .ndjson).
std::optional<OutputFormat> output_format_for_path(std::string_view path);

// Optional columns / fields; sender and content are always written.
struct OutputConfig {
  bool timestamps = false;
  bool ids        = false;
  bool replies    = false;
  bool edited     = false;
};

// Serializes messages one at a time to a caller-owned stream.
class MessageWriter {
public:
  virtual ~MessageWriter() = default;

  virtual bool begin() = 0;
  virtual bool write(const Message& m) = 0;
  virtual bool finish() = 0;

  std::uint64_t written() const noexcept { return written_; }
  const std::string& error() const { return err_; }

protected:
  MessageWriter(std::ostream& out, OutputConfig cfg) : out_(out), cfg_(cfg) {}
  bool check();   // false (and error set) once the stream has failed

  std::ostream& out_;
  OutputConfig cfg_;
  std::uint64_t written_{0};
  std::string err_;
};

std::unique_ptr<MessageWriter> make_writer(OutputFormat f, std::ostream& out, OutputConfig cfg);

}
