#include "chatpack/chunk_reader.hpp"
#include "../test_util.hpp"
#include <string>

using cp_test::check;
using cp_test::check_eq;

int main(){
  // lines longer than the block come out in pieces
  auto f = cp_test::write_temp("reader.txt", "alpha\r\nbravo-bravo-bravo\n\ncharlie");
  cp::ChunkReader::Config cfg; cfg.chunk_bytes = 4;
  cp::ChunkReader r(f.string(), cfg);
  if (!r.open()) { std::cerr << "[ERR] cannot open " << f << "\n"; return 2; }
  check_eq(r.file_size(), std::uint64_t{33}, "file size");

  std::string line;
  bool oversize = false;
  std::uint64_t n = 0;
  check(r.read_line(line, 100, oversize, &n), "line 1");
  check_eq(line, std::string("alpha"), "CR stripped");
  check(r.read_line(line, 8, oversize, &n), "line 2");
  check(oversize, "line 2 oversize");
  check_eq(n, std::uint64_t{17}, "line 2 full length reported");
  check_eq(line.size(), std::size_t{8}, "line 2 prefix kept");
  check(r.read_line(line, 100, oversize) && line.empty() && !oversize, "blank line");
  check(r.read_line(line, 100, oversize), "last line without newline");
  check_eq(line, std::string("charlie"), "line 4");
  check(!r.read_line(line, 100, oversize), "EOF");
  check(!r.failed(), "no read error");
  check_eq(r.bytes_read(), std::uint64_t{33}, "all bytes consumed");

  // segments never cross a newline and never exceed the block
  check(r.rewind(), "rewind");
  cp::Segment seg;
  std::string joined;
  std::size_t ends = 0;
  while (r.next_segment(seg)) {
    check(seg.text.size() <= 4, "segment bounded by block size");
    check(seg.text.find('\n') == std::string_view::npos, "segment without newline");
    joined.append(seg.text);
    if (seg.line_end) { joined.push_back('|'); ++ends; }
  }
  check_eq(ends, std::size_t{4}, "line ends");
  check_eq(joined, std::string("alpha\r|bravo-bravo-bravo||charlie|"), "segments reassemble input");

  cp::ChunkReader missing("/nonexistent/chatpack/none.json");
  check(!missing.open(), "missing file fails to open");
  check(missing.last_error() != 0, "errno recorded");

  return cp_test::finish("chunk_reader");
}
