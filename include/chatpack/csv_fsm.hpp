#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace cp {

struct CsvConfig {
  char delimiter = ',';
  char quote     = '"';
  bool header    = true;
};

// Line-fed RFC 4180 reader. Quoted fields may span lines; a record is
// delivered once its last line has been fed.
class CsvFsm {
public:
  using RecordCallback = std::function<void(const std::vector<std::string>&)>;

  explicit CsvFsm(const CsvConfig& cfg);
  ~CsvFsm();

  CsvFsm(const CsvFsm&) = delete;
  CsvFsm& operator=(const CsvFsm&) = delete;

  // Feeds one line without its '\n'. The first complete record becomes the
  // header when cfg.header is set. False on a stray character after a
  // closing quote (see error()).
  bool feed(std::string_view line, const RecordCallback& on_record);

  // False if input ended inside a quoted field.
  bool finish();

  // Drops the record in progress but keeps following its quoting until
  // it ends, so its remaining lines are not read as new records.
  void discard_record();

  bool in_record() const noexcept;
  std::size_t pending_bytes() const noexcept;   // bytes held for the open record
  const std::vector<std::string>& header() const;
  const std::string& error() const { return err_; }
  std::uint64_t rows() const { return rows_; }

private:
  struct Impl; Impl* p_;
  std::uint64_t rows_{0};
  std::string err_;
};

}
