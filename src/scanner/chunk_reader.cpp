#include "chatpack/chunk_reader.hpp"
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <string_view>
#include <system_error>
#include <vector>

namespace cp {

struct ChunkReader::Impl {
  std::string path;
  Config cfg;
  FILE* f{nullptr};
  int last_errno{0};
  bool failed{false};
  std::uint64_t consumed{0};
  std::uint64_t size{0};

  std::vector<char> buf;
  std::size_t pos{0};
  std::size_t len{0};
  bool mid_line{false}; // last segment did not close its line

  bool open() {
    if (f) return true;
    f = std::fopen(path.c_str(), "rb");
    if (!f) { last_errno = errno; failed = true; return false; }
    std::error_code ec;
    auto sz = std::filesystem::file_size(path, ec);
    size = ec ? 0 : static_cast<std::uint64_t>(sz);
    if (cfg.chunk_bytes == 0) cfg.chunk_bytes = 64 * 1024;
    buf.assign(cfg.chunk_bytes, 0);
    pos = len = 0;
    consumed = 0;
    mid_line = false;
    return true;
  }

  void close() noexcept {
    if (f) { std::fclose(f); f = nullptr; }
    std::vector<char>().swap(buf);
    pos = len = 0;
  }

  bool fill() {
    std::size_t n = std::fread(buf.data(), 1, buf.size(), f);
    if (n == 0) {
      if (std::ferror(f)) { last_errno = errno ? errno : EIO; failed = true; }
      return false;
    }
    pos = 0; len = n;
    return true;
  }

  bool next_segment(Segment& out) {
    if (!f || failed) return false;
    if (pos == len && !fill()) {
      if (failed) return false;
      if (mid_line) {
        // file ended without a trailing newline; close the pending line
        mid_line = false;
        out.text = std::string_view{};
        out.line_end = true;
        return true;
      }
      return false;
    }

    const char* start = buf.data() + pos;
    const std::size_t avail = len - pos;
    const void* nl = std::memchr(start, '\n', avail);
    if (nl) {
      std::size_t n = static_cast<const char*>(nl) - start;
      out.text = std::string_view(start, n);
      out.line_end = true;
      pos += n + 1;
      consumed += n + 1;
      mid_line = false;
    } else {
      out.text = std::string_view(start, avail);
      out.line_end = false;
      pos = len;
      consumed += avail;
      mid_line = true;
    }
    return true;
  }

  bool read_line(std::string& out, std::size_t max_bytes, bool& oversize,
                 std::uint64_t* line_bytes) {
    out.clear();
    oversize = false;
    std::uint64_t total = 0;
    Segment seg;
    bool any = false;
    while (next_segment(seg)) {
      any = true;
      total += seg.text.size();
      if (!oversize) {
        if (out.size() + seg.text.size() > max_bytes) {
          out.append(seg.text.substr(0, max_bytes - out.size()));
          oversize = true; // keep draining until newline
        } else {
          out.append(seg.text);
        }
      }
      if (seg.line_end) break;
    }
    if (!any) return false;
    if (cfg.strip_cr && !oversize && !out.empty() && out.back() == '\r') {
      out.pop_back();
      --total;
    }
    if (line_bytes) *line_bytes = total;
    return true;
  }
};

ChunkReader::ChunkReader(std::string path)
  : ChunkReader(std::move(path), Config{}) {}

ChunkReader::ChunkReader(std::string path, Config cfg)
  : p_(new Impl{std::move(path), cfg}) {}

ChunkReader::~ChunkReader() { p_->close(); delete p_; }

bool ChunkReader::open() { return p_->open(); }
bool ChunkReader::is_open() const noexcept { return p_->f != nullptr; }
void ChunkReader::close() noexcept { p_->close(); }

bool ChunkReader::rewind() {
  if (!p_->f) return false;
  if (std::fseek(p_->f, 0, SEEK_SET) != 0) {
    p_->last_errno = errno; p_->failed = true; return false;
  }
  std::clearerr(p_->f);
  p_->pos = p_->len = 0;
  p_->consumed = 0;
  p_->mid_line = false;
  return true;
}

bool ChunkReader::next_segment(Segment& out) { return p_->next_segment(out); }

bool ChunkReader::read_line(std::string& out, std::size_t max_bytes, bool& oversize,
                            std::uint64_t* line_bytes) {
  return p_->read_line(out, max_bytes, oversize, line_bytes);
}

bool          ChunkReader::failed() const noexcept { return p_->failed; }
int           ChunkReader::last_error() const noexcept { return p_->last_errno; }
std::uint64_t ChunkReader::bytes_read() const noexcept { return p_->consumed; }
std::uint64_t ChunkReader::file_size() const noexcept { return p_->size; }
const std::string& ChunkReader::path() const noexcept { return p_->path; }

}
