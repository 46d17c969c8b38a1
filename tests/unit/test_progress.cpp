#include "chatpack/progress.hpp"
#include "chatpack/metrics.hpp"
#include "chatpack/stream_error.hpp"
#include "../test_util.hpp"
#include <string>

using cp_test::check;
using cp_test::check_eq;

int main(){
  {
    cp::ProgressTracker t;
    check(!t.snapshot().percentage().has_value(), "unknown total");
    t.set_total(200);
    t.advance_to(50);
    t.advance_to(20);
    check_eq(t.bytes(), std::uint64_t{50}, "bytes never move back");
    auto pct = t.snapshot().percentage();
    if (check(pct.has_value(), "known total")) check(*pct > 24.9 && *pct < 25.1, "25 percent");
    t.advance_to(500);
    check(*t.snapshot().percentage() == 100.0, "clamped at 100");
  }
  {
    cp::ProgressTracker t;
    t.set_total(0);
    check(*t.snapshot().percentage() == 100.0, "empty input is complete");
  }
  {
    cp::ProgressTracker t;
    t.set_total(1000);
    t.advance_to(10);
    t.finish();
    check_eq(t.bytes(), std::uint64_t{1000}, "finish snaps to total");
  }
  {
    cp::ProgressTracker t;
    int due = 0;
    for (int i = 0; i < 25; ++i) { t.add_items(); if (t.report_due(10)) ++due; }
    check_eq(due, 2, "report every 10 items");
    check(!t.report_due(0), "interval 0 disables");
    check_eq(t.snapshot().items_processed, std::uint64_t{25}, "items");
  }

  {
    cp::MetricsRegistry m;
    m.add_unit(); m.add_unit(); m.add_unit();
    m.add_message(); m.add_message();
    m.add_dropped();
    m.add_error(cp::ErrorKind::Decode, true);
    m.add_error(cp::ErrorKind::Decode, true);
    m.add_error(cp::ErrorKind::SizeLimitExceeded, false);
    m.set_bytes(2 * 1024 * 1024);
    m.start_stage("parse");
    m.end_stage("parse");
    m.end_stage("never_started");

    check_eq(m.errors_of(cp::ErrorKind::Decode), std::uint64_t{2}, "decode errors");
    check_eq(m.errors_of(cp::ErrorKind::Io), std::uint64_t{0}, "no io errors");
    auto s = m.snapshot(1000.0);
    check_eq(s.units, std::uint64_t{3}, "units");
    check_eq(s.messages, std::uint64_t{2}, "messages");
    check_eq(s.dropped, std::uint64_t{1}, "dropped");
    check_eq(s.errors_skipped, std::uint64_t{2}, "skipped");
    check_eq(s.errors_surfaced, std::uint64_t{1}, "surfaced");
    check(s.throughput_mb_s > 1.99 && s.throughput_mb_s < 2.01, "throughput");
    check(s.messages_per_sec > 1.99 && s.messages_per_sec < 2.01, "messages per second");
    check_eq(s.stages.size(), std::size_t{1}, "one stage recorded");
    check_eq(s.errors_by_kind["size_limit_exceeded"], std::uint64_t{1}, "errors by kind");
    check(m.snapshot(0.0).throughput_mb_s == 0.0, "zero wall time");
    m.reset();
    check_eq(m.units(), std::uint64_t{0}, "reset");
  }

  {
    auto e = cp::StreamError::size_limit(100, 250);
    e.record_index = 4;
    check_eq(e.what(), std::string("record size 250 bytes exceeds limit of 100 bytes (record 4)"), "size error text");
    check(!e.fatal, "size error not fatal by default");
    check(cp::StreamError::io("x").fatal, "io fatal");
    check(cp::StreamError::invalid_format("x").fatal, "invalid format fatal");
    check_eq(std::string(cp::error_kind_name(cp::ErrorKind::UnexpectedEof)), std::string("unexpected_eof"), "kind name");
  }

  return cp_test::finish("progress");
}
