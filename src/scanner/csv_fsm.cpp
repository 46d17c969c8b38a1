#include "chatpack/csv_fsm.hpp"

namespace cp {

struct CsvFsm::Impl {
  CsvConfig cfg;
  enum class Mode { FieldStart, Unquoted, Quoted, QuoteEscape } mode = Mode::FieldStart;

  std::vector<std::string> header;
  std::vector<std::string> fields;
  std::string field;
  bool has_header{false};
  bool open{false};        // record started and not yet delivered
  bool discarding{false};
  std::size_t pending{0};

  void end_field() {
    if (!discarding) fields.push_back(std::move(field));
    field.clear();
  }

  void put(char c) {
    if (discarding) return;
    field.push_back(c);
    ++pending;
  }

  // Returns false on malformed quoting; sets `complete` when the line
  // closed the record.
  bool parse_line(std::string_view line, bool& complete) {
    complete = false;
    open = true;
    for (char c : line) {
      switch (mode) {
        case Mode::FieldStart:
          if (c == cfg.quote) { mode = Mode::Quoted; break; }
          mode = Mode::Unquoted;
          [[fallthrough]];
        case Mode::Unquoted:
          if (c == cfg.delimiter) { end_field(); mode = Mode::FieldStart; }
          else put(c);
          break;
        case Mode::Quoted:
          if (c == cfg.quote) mode = Mode::QuoteEscape;
          else put(c);
          break;
        case Mode::QuoteEscape:
          if (c == cfg.quote) {
            put(c);                          // escaped quote
            mode = Mode::Quoted;
          } else if (c == cfg.delimiter) {
            end_field();
            mode = Mode::FieldStart;
          } else if (c == '\r') {
            // CRLF line ending after a closing quote
          } else {
            return false;
          }
          break;
      }
    }
    if (mode == Mode::Quoted) {
      put('\n');                             // newline inside quoted field
      return true;
    }
    if (mode == Mode::Unquoted && !field.empty() && field.back() == '\r') field.pop_back();
    end_field();
    mode = Mode::FieldStart;
    complete = true;
    return true;
  }

  void reset_record() {
    fields.clear();
    field.clear();
    mode = Mode::FieldStart;
    open = false;
    discarding = false;
    pending = 0;
  }
};

CsvFsm::CsvFsm(const CsvConfig& cfg) : p_(new Impl{cfg}), rows_(0) {}
CsvFsm::~CsvFsm() { delete p_; }

const std::vector<std::string>& CsvFsm::header() const { return p_->header; }
bool CsvFsm::in_record() const noexcept { return p_->open; }
std::size_t CsvFsm::pending_bytes() const noexcept { return p_->pending; }

bool CsvFsm::feed(std::string_view line, const RecordCallback& on_record) {
  bool complete = false;
  if (!p_->parse_line(line, complete)) {
    err_ = "CSV parse error (character after closing quote)";
    p_->reset_record();
    return false;
  }
  if (!complete) return true;

  if (p_->discarding) { p_->reset_record(); return true; }

  if (p_->cfg.header && !p_->has_header) {
    p_->header = std::move(p_->fields);
    p_->has_header = true;
    p_->reset_record();
    return true;
  }

  // blank line between records
  if (p_->fields.size() == 1 && p_->fields[0].empty()) { p_->reset_record(); return true; }

  on_record(p_->fields);
  ++rows_;
  p_->reset_record();
  return true;
}

bool CsvFsm::finish() {
  if (p_->mode == Impl::Mode::Quoted) {
    err_ = "CSV input ended inside a quoted field";
    p_->reset_record();
    return false;
  }
  return true;
}

void CsvFsm::discard_record() {
  p_->discarding = true;
  p_->fields.clear();
  p_->field.clear();
  p_->pending = 0;
}

}
