#include "chatpack/message_writer.hpp"
#include "chatpack/date_parse.hpp"
#include "chatpack/path_utils.hpp"
#include "chatpack/run_json.hpp"
#include <cctype>

namespace cp {

const char* output_format_name(OutputFormat f) noexcept {
  switch (f) {
    case OutputFormat::Csv:   return "csv";
    case OutputFormat::Json:  return "json";
    case OutputFormat::Jsonl: return "jsonl";
  }
  return "csv";
}

std::optional<OutputFormat> parse_output_format(std::string_view s) {
  std::string k(s);
  for (auto& c : k) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (k == "csv") return OutputFormat::Csv;
  if (k == "json") return OutputFormat::Json;
  if (k == "jsonl" || k == "ndjson") return OutputFormat::Jsonl;
  return std::nullopt;
}

std::optional<OutputFormat> output_format_for_path(std::string_view path) {
  switch (detect_format(path)) {
    case FileFormat::CSV:   return OutputFormat::Csv;
    case FileFormat::JSON:  return OutputFormat::Json;
    case FileFormat::JSONL: return OutputFormat::Jsonl;
    default: return std::nullopt;
  }
}

bool MessageWriter::check() {
  if (out_) return true;
  if (err_.empty()) err_ = "output stream write failed";
  return false;
}

namespace {

constexpr const char* kCsvTime  = "%Y-%m-%d %H:%M:%S";
constexpr const char* kJsonTime = "%Y-%m-%dT%H:%M:%SZ";

class CsvWriter : public MessageWriter {
public:
  CsvWriter(std::ostream& out, OutputConfig cfg) : MessageWriter(out, cfg) {}

  bool begin() override {
    bool first = true;
    auto col = [&](const char* name){ if (!first) out_ << ';'; out_ << name; first = false; };
    if (cfg_.ids) col("ID");
    if (cfg_.timestamps) col("Timestamp");
    col("Sender");
    col("Content");
    if (cfg_.replies) col("ReplyTo");
    if (cfg_.edited) col("Edited");
    out_ << '\n';
    return check();
  }

  bool write(const Message& m) override {
    bool first = true;
    auto cell = [&](std::string_view v){ if (!first) out_ << ';'; field(v); first = false; };
    if (cfg_.ids) cell(m.id ? std::to_string(*m.id) : std::string());
    if (cfg_.timestamps) cell(m.timestamp ? format_utc(*m.timestamp, kCsvTime) : std::string());
    cell(m.sender);
    cell(m.content);
    if (cfg_.replies) cell(m.reply_to ? std::to_string(*m.reply_to) : std::string());
    if (cfg_.edited) cell(m.edited ? format_utc(*m.edited, kCsvTime) : std::string());
    out_ << '\n';
    ++written_;
    return check();
  }

  bool finish() override { out_.flush(); return check(); }

private:
  void field(std::string_view v) {
    if (v.find_first_of(";\"\n\r") == std::string_view::npos) { out_ << v; return; }
    out_ << '"';
    for (char c : v) { if (c == '"') out_ << '"'; out_ << c; }
    out_ << '"';
  }
};

// Shared field projection of the JSON and JSONL writers.
void write_object(std::ostream& o, const Message& m, const OutputConfig& cfg, bool pretty) {
  const char* sep   = pretty ? ",\n    " : ",";
  const char* colon = pretty ? ": " : ":";
  bool first = true;
  auto key = [&](const char* name){ if (!first) o << sep; first = false; o << '"' << name << '"' << colon; };

  o << (pretty ? "  {\n    " : "{");
  key("sender");  json_escape(o, m.sender);
  key("content"); json_escape(o, m.content);
  if (cfg.timestamps && m.timestamp) { key("timestamp"); json_escape(o, format_utc(*m.timestamp, kJsonTime)); }
  if (cfg.ids && m.id) { key("id"); o << *m.id; }
  if (cfg.replies && m.reply_to) { key("reply_to"); o << *m.reply_to; }
  if (cfg.edited && m.edited) { key("edited"); json_escape(o, format_utc(*m.edited, kJsonTime)); }
  o << (pretty ? "\n  }" : "}");
}

class JsonWriter : public MessageWriter {
public:
  JsonWriter(std::ostream& out, OutputConfig cfg) : MessageWriter(out, cfg) {}

  bool begin() override { out_ << '['; return check(); }

  bool write(const Message& m) override {
    out_ << (written_ ? ",\n" : "\n");
    write_object(out_, m, cfg_, true);
    ++written_;
    return check();
  }

  bool finish() override {
    out_ << (written_ ? "\n]\n" : "]\n");
    out_.flush();
    return check();
  }
};

class JsonlWriter : public MessageWriter {
public:
  JsonlWriter(std::ostream& out, OutputConfig cfg) : MessageWriter(out, cfg) {}

  bool begin() override { return check(); }

  bool write(const Message& m) override {
    write_object(out_, m, cfg_, false);
    out_ << '\n';
    ++written_;
    return check();
  }

  bool finish() override { out_.flush(); return check(); }
};

}

std::unique_ptr<MessageWriter> make_writer(OutputFormat f, std::ostream& out, OutputConfig cfg) {
  switch (f) {
    case OutputFormat::Json:  return std::make_unique<JsonWriter>(out, cfg);
    case OutputFormat::Jsonl: return std::make_unique<JsonlWriter>(out, cfg);
    case OutputFormat::Csv:   break;
  }
  return std::make_unique<CsvWriter>(out, cfg);
}

}
