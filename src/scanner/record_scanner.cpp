#include "chatpack/record_scanner.hpp"
#include "chatpack/chunk_reader.hpp"
#include "chatpack/record_buffer.hpp"
#include <cstring>

namespace cp {

struct RecordScanner::Impl {
  ChunkReader& reader;
  Config cfg;
  RecordBuffer buf;

  std::string pending;          // array body found on the locate line
  std::string_view cur;
  std::size_t pos{0};
  bool line_end{false};
  bool have_cur{false};

  int  depth{0};
  bool in_object{false};
  bool in_string{false};
  bool escape{false};
  bool discarding{false};       // skipping the rest of an oversized object
  bool done{false};
  std::uint64_t carved{0};

  Impl(ChunkReader& r, Config c) : reader(r), cfg(std::move(c)) {}

  // Size-limit handling shared by the "object closed" and "segment ended"
  // paths. The first object is terminal; later ones are skipped.
  Status overflow(std::size_t actual, bool object_closed, StreamError& err) {
    buf.reset_and_shrink(cfg.retain_bytes);
    err = StreamError::size_limit(cfg.max_record_size, actual);
    if (carved == 0) {
      err.fatal = true;
      err.detail = "first record of the array";
      done = true;
      return Status::Error;
    }
    if (!object_closed) discarding = true;
    return Status::Error;
  }

  bool fetch(StreamError& err, Status& st) {
    Segment seg;
    if (!reader.next_segment(seg)) {
      done = true;
      have_cur = false;
      if (reader.failed()) {
        err = StreamError::io(std::string("read failed: ") + std::strerror(reader.last_error()));
        st = Status::Error;
      } else if (in_object && !discarding) {
        buf.reset();
        err = StreamError::unexpected_eof("input ended inside a record");
        st = Status::Error;
      } else {
        st = Status::End;
      }
      return false;
    }
    pending.clear();
    cur = seg.text;
    line_end = seg.line_end;
    pos = 0;
    have_cur = true;
    return true;
  }

  Status next(std::string_view& out, StreamError& err) {
    buf.reset();
    while (!done) {
      if (!have_cur) {
        Status st;
        if (!fetch(err, st)) return st;
      }

      const std::size_t n = cur.size();
      std::size_t run_start = pos;
      for (std::size_t i = pos; i < n; ++i) {
        const char c = cur[i];
        if (!in_object) {
          if (c == '{') {
            in_object = true; depth = 1;
            in_string = false; escape = false;
            run_start = i;
          } else if (c == ']') {
            done = true;
            return Status::End;
          }
          continue;
        }
        if (cfg.string_aware) {
          if (in_string) {
            if (escape) escape = false;
            else if (c == '\\') escape = true;
            else if (c == '"') in_string = false;
            continue;
          }
          if (c == '"') { in_string = true; continue; }
        }
        if (c == '{') { ++depth; continue; }
        if (c != '}' || --depth != 0) continue;

        // object closed at i
        in_object = false;
        pos = i + 1;
        if (discarding) { discarding = false; continue; }
        const std::size_t len = i + 1 - run_start;
        if (buf.size() + len > cfg.max_record_size)
          return overflow(buf.size() + len, true, err);
        buf.append(cur.substr(run_start, len));
        ++carved;
        out = buf.view();
        return Status::Record;
      }

      // segment exhausted with an object still open
      if (in_object && !discarding) {
        const std::size_t len = n - run_start;
        const std::size_t add = len + (line_end ? 1 : 0);
        if (buf.size() + add > cfg.max_record_size) {
          have_cur = false;
          return overflow(buf.size() + add, false, err);
        }
        buf.append(cur.substr(run_start, len));
        if (line_end) buf.push_back('\n');
      }
      have_cur = false;
    }
    return Status::End;
  }

  bool locate(StreamError& err) {
    const std::string needle = "\"" + cfg.key + "\"";
    std::string carry;
    bool key_on_line = false;
    std::uint64_t scanned = 0;
    Segment seg;

    while (reader.next_segment(seg)) {
      scanned += seg.text.size() + (seg.line_end ? 1 : 0);
      std::string_view text = seg.text;
      std::string joined;

      if (!key_on_line) {
        if (!carry.empty()) { joined = carry; joined.append(text); text = joined; }
        std::size_t k = text.find(needle);
        if (k == std::string_view::npos) {
          // keep a tail long enough to catch a key split across pieces
          std::size_t keep = needle.size() - 1;
          carry.assign(text.size() > keep ? text.substr(text.size() - keep) : text);
          if (seg.line_end) carry.clear();
          if (scanned > cfg.locate_cap_bytes) break;
          continue;
        }
        key_on_line = true;
        carry.clear();
        text = text.substr(k + needle.size());
      }

      std::size_t b = text.find('[');
      if (b != std::string_view::npos) {
        pending.assign(text.substr(b + 1));
        cur = pending;
        pos = 0;
        line_end = seg.line_end;
        have_cur = true;
        return true;
      }
      if (seg.line_end) key_on_line = false;
      if (scanned > cfg.locate_cap_bytes) break;
    }

    done = true;
    if (reader.failed()) {
      err = StreamError::io(std::string("read failed: ") + std::strerror(reader.last_error()));
    } else if (scanned > cfg.locate_cap_bytes) {
      err = StreamError::invalid_format("array \"" + cfg.key + "\" not found in the first " +
                                        std::to_string(cfg.locate_cap_bytes) + " bytes");
    } else {
      err = StreamError::invalid_format("array \"" + cfg.key + "\" not found");
    }
    return false;
  }
};

RecordScanner::RecordScanner(ChunkReader& reader, Config cfg)
  : p_(new Impl(reader, std::move(cfg))) {}

RecordScanner::~RecordScanner() { delete p_; }

bool RecordScanner::locate() { return p_->locate(err_); }

RecordScanner::Status RecordScanner::next_record(std::string_view& out) {
  return p_->next(out, err_);
}

std::uint64_t RecordScanner::records() const noexcept { return p_->carved; }
std::size_t   RecordScanner::high_water() const noexcept { return p_->buf.high_water(); }
std::size_t   RecordScanner::buffer_capacity() const noexcept { return p_->buf.capacity(); }

}
