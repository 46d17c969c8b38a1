#include "chatpack/csv_fsm.hpp"
#include "../test_util.hpp"
#include <string>
#include <vector>

using cp_test::check;
using cp_test::check_eq;

using Rows = std::vector<std::vector<std::string>>;

static bool feed_all(cp::CsvFsm& csv, const std::vector<std::string>& lines, Rows& out) {
  for (const auto& l : lines)
    if (!csv.feed(l, [&](const std::vector<std::string>& r){ out.push_back(r); })) return false;
  return csv.finish();
}

int main(){
  {
    cp::CsvFsm csv(cp::CsvConfig{});
    Rows rows;
    bool ok = feed_all(csv, {
      "AuthorID,Author,Date,Content",
      "1,alice,2024-01-15,plain",
      "2,bob,2024-01-15,\"quoted, with comma\"",
      "",
      "3,carol,2024-01-15,\"spans",
      "two \"\"lines\"\"\"",
      "4,dave,,",
    }, rows);
    check(ok, "well-formed input");
    check_eq(csv.header().size(), std::size_t{4}, "header columns");
    check_eq(csv.header()[3], std::string("Content"), "header name");
    if (check_eq(rows.size(), std::size_t{4}, "data rows")) {
      check_eq(rows[1][3], std::string("quoted, with comma"), "delimiter inside quotes");
      check_eq(rows[2][3], std::string("spans\ntwo \"lines\""), "multi-line field with escaped quotes");
      check_eq(rows[3].size(), std::size_t{4}, "empty trailing fields kept");
      check_eq(rows[3][2], std::string(""), "empty field");
    }
    check_eq(csv.rows(), std::uint64_t{4}, "row count");
  }

  {
    cp::CsvConfig cfg; cfg.delimiter = ';'; cfg.header = false;
    cp::CsvFsm csv(cfg);
    Rows rows;
    check(feed_all(csv, {"a;b;c\r", "\"x\";\"y\"\r"}, rows), "semicolon, CRLF");
    if (check_eq(rows.size(), std::size_t{2}, "no header row"))  {
      check_eq(rows[0][2], std::string("c"), "trailing CR removed");
      check_eq(rows[1][1], std::string("y"), "CR after closing quote");
    }
  }

  {
    cp::CsvFsm csv(cp::CsvConfig{});
    Rows rows;
    auto cb = [&](const std::vector<std::string>& r){ rows.push_back(r); };
    check(csv.feed("h1,h2", cb), "header");
    check(csv.feed("1,\"big", cb), "open record");
    check(csv.in_record(), "record open across lines");
    check(csv.pending_bytes() >= 4, "pending bytes tracked");
    csv.discard_record();
    check(csv.feed("still inside, the quote", cb), "discarded continuation");
    check(csv.feed("end\",x", cb), "discarded record closes");
    check(csv.feed("2,after", cb), "next record");
    check(csv.finish(), "clean finish");
    if (check_eq(rows.size(), std::size_t{1}, "only the record after the discard"))
      check_eq(rows[0][1], std::string("after"), "resumed on the next record");
  }

  {
    cp::CsvFsm csv(cp::CsvConfig{});
    Rows rows;
    auto cb = [&](const std::vector<std::string>& r){ rows.push_back(r); };
    check(csv.feed("h", cb), "header");
    check(!csv.feed("\"bad\"x", cb), "stray character after quote");
    check(!csv.error().empty(), "error text");
    check(csv.feed("\"open", cb), "unterminated quote begins");
    check(!csv.finish(), "eof inside quotes");
  }

  return cp_test::finish("csv_fsm");
}
