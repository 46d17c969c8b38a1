#include "chatpack/filter.hpp"
#include "chatpack/message_stream.hpp"
#include "chatpack/message_writer.hpp"
#include "chatpack/metrics.hpp"
#include "chatpack/path_utils.hpp"
#include "chatpack/platform.hpp"
#include "chatpack/processor.hpp"
#include "chatpack/run_json.hpp"

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

const char* kUsage =
  "Usage: chatpack <telegram|whatsapp|instagram|discord> <input> [options]\n"
  "  -o, --output=PATH         output file (default optimized_chat.csv)\n"
  "      --format=csv|json|jsonl\n"
  "  -t, --timestamps          include timestamps\n"
  "  -r, --replies             include reply ids\n"
  "      --ids                 include message ids\n"
  "      --edited              include edit timestamps\n"
  "      --after=YYYY-MM-DD    keep messages from this day on\n"
  "      --before=YYYY-MM-DD   keep messages up to this day\n"
  "      --from=USER           keep messages of one sender\n"
  "      --no-merge            do not merge consecutive messages\n"
  "      --buffer-size=N       read-ahead bytes\n"
  "      --max-record-size=N   per-record limit in bytes\n"
  "      --streaming-preset    larger read-ahead\n"
  "      --strict              stop at the first invalid record\n"
  "      --keep-system         keep WhatsApp service messages\n"
  "      --no-fix-encoding     skip Instagram mojibake repair\n"
  "      --account-names       Discord: account name instead of server nickname\n"
  "      --no-attachments      Discord: drop attachment and sticker lines\n"
  "      --literal-braces      count braces inside strings when carving\n"
  "      --progress-interval=N report every N messages (0 = off)\n"
  "      --report=PATH         write a run.json summary\n"
  "  -q, --quiet               no progress lines\n";

struct UsageError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

struct Cli {
  cp::Platform platform = cp::Platform::Telegram;
  std::string input;
  std::string output = "optimized_chat.csv";
  std::string format;                     // empty: from output extension
  std::string after, before, from;
  std::string report;
  bool merge = true;
  bool quiet = false;
  cp::OutputConfig out_cfg;
  cp::StreamingConfig stream_cfg;
};

std::size_t to_size(const std::string& v, const char* flag) {
  std::size_t pos = 0;
  unsigned long long n = std::stoull(v, &pos);
  if (pos != v.size()) throw UsageError(std::string("invalid number for ") + flag + ": " + v);
  return static_cast<std::size_t>(n);
}

Cli parse_cli(int argc, char** argv) {
  Cli c;
  std::vector<std::string> positional;
  bool preset = false;
  std::string buffer_size, max_record, interval;

  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    auto eat = [&](const char* pfx, std::string* out){
      if (a.rfind(pfx, 0) == 0) { *out = a.substr(std::string(pfx).size()); return true; }
      return false;
    };
    if (eat("--output=", &c.output)) continue;
    if (a == "-o" && i+1 < argc) { c.output = argv[++i]; continue; }
    if (eat("--format=", &c.format)) continue;
    if (eat("--after=", &c.after)) continue;
    if (eat("--before=", &c.before)) continue;
    if (eat("--from=", &c.from)) continue;
    if (eat("--report=", &c.report)) continue;
    if (eat("--buffer-size=", &buffer_size)) continue;
    if (eat("--max-record-size=", &max_record)) continue;
    if (eat("--progress-interval=", &interval)) continue;
    if (a == "-t" || a == "--timestamps") { c.out_cfg.timestamps = true; continue; }
    if (a == "-r" || a == "--replies")    { c.out_cfg.replies = true; continue; }
    if (a == "--ids")                     { c.out_cfg.ids = true; continue; }
    if (a == "--edited")                  { c.out_cfg.edited = true; continue; }
    if (a == "--no-merge")                { c.merge = false; continue; }
    if (a == "--streaming-preset")        { preset = true; continue; }
    if (a == "--strict")                  { c.stream_cfg.skip_invalid = false; continue; }
    if (a == "--keep-system")             { c.stream_cfg.skip_system_messages = false; continue; }
    if (a == "--no-fix-encoding")         { c.stream_cfg.fix_encoding = false; continue; }
    if (a == "--account-names")           { c.stream_cfg.prefer_nickname = false; continue; }
    if (a == "--no-attachments")          { c.stream_cfg.include_attachments = false; continue; }
    if (a == "--literal-braces")          { c.stream_cfg.string_aware_scan = false; continue; }
    if (a == "-q" || a == "--quiet")      { c.quiet = true; continue; }
    if (a == "-h" || a == "--help") {
      std::cout << kUsage;
      std::exit(0);
    }
    if (a.size() > 1 && a[0] == '-') throw UsageError("unknown option: " + a);
    positional.push_back(a);
  }

  if (positional.size() != 2) throw UsageError("expected <source> and <input>");
  auto p = cp::parse_platform(positional[0]);
  if (!p) throw UsageError("unknown source: " + positional[0]);
  c.platform = *p;
  c.input = positional[1];

  if (preset) c.stream_cfg.buffer_size = cp::StreamingConfig::streaming_optimized().buffer_size;
  if (!buffer_size.empty()) c.stream_cfg.buffer_size = to_size(buffer_size, "--buffer-size");
  if (!max_record.empty())  c.stream_cfg.max_record_size = to_size(max_record, "--max-record-size");
  if (!interval.empty())    c.stream_cfg.progress_interval = to_size(interval, "--progress-interval");
  if (c.stream_cfg.buffer_size == 0 || c.stream_cfg.max_record_size == 0)
    throw UsageError("buffer and record sizes must be positive");
  return c;
}

void print_progress(const cp::MessageStream& s) {
  auto snap = s.progress();
  std::cerr << "[stream] ";
  if (auto pct = snap.percentage())
    std::cerr << std::fixed << std::setprecision(1) << *pct << "% ";
  std::cerr << "(" << snap.items_processed << " messages, " << snap.bytes_processed << " bytes)\n";
}

int run(const Cli& cli) {
  namespace ch = std::chrono;
  const auto t0 = ch::steady_clock::now();

  // --- collaborators
  cp::FilterConfig filter;
  if (!cli.after.empty() && !filter.set_after(cli.after))
    throw UsageError("invalid --after date (YYYY-MM-DD): " + cli.after);
  if (!cli.before.empty() && !filter.set_before(cli.before))
    throw UsageError("invalid --before date (YYYY-MM-DD): " + cli.before);
  if (!cli.from.empty()) filter.sender = cli.from;

  cp::OutputFormat fmt = cp::OutputFormat::Csv;
  if (!cli.format.empty()) {
    auto f = cp::parse_output_format(cli.format);
    if (!f) throw UsageError("unknown --format: " + cli.format);
    fmt = *f;
  } else if (auto f = cp::output_format_for_path(cli.output)) {
    fmt = *f;
  }

  // --- output
  if (!cp::ensure_parent_dirs(cli.output)) {
    std::cerr << "[write] cannot create directory for " << cli.output << "\n";
    return 2;
  }
  std::ofstream out(cli.output, std::ios::binary | std::ios::trunc);
  if (!out) {
    std::cerr << "[write] cannot open " << cli.output << "\n";
    return 2;
  }
  auto writer = cp::make_writer(fmt, out, cli.out_cfg);
  cp::MessageMerger merger;
  cp::MetricsRegistry stages;
  std::uint64_t filtered = 0;
  int rc = 0;

  auto emit = [&](const cp::Message& m) {
    if (writer->write(m)) return true;
    std::cerr << "[write] " << writer->error() << "\n";
    rc = 2;
    return false;
  };

  // --- stream
  auto stream = cp::open_stream(cli.platform, cli.input, cli.stream_cfg);
  stages.start_stage("stream");
  bool ok = writer->begin();
  if (!ok) { std::cerr << "[write] " << writer->error() << "\n"; rc = 2; }
  while (ok) {
    auto r = stream->next();
    if (!r) break;
    if (!r->ok()) {
      const cp::StreamError& e = r->error();
      std::cerr << "[stream] " << (e.fatal ? "fatal: " : "error: ") << e.what() << "\n";
      rc = e.fatal ? 2 : 3;
      break;
    }
    cp::Message& m = r->message();
    if (!filter.matches(m)) { ++filtered; continue; }
    if (cli.merge) {
      if (auto done = merger.push(std::move(m))) ok = emit(*done);
    } else {
      ok = emit(m);
    }
    if (!cli.quiet && stream->progress_report_due()) print_progress(*stream);
  }
  if (ok && cli.merge) {
    if (auto last = merger.flush()) ok = emit(*last);
  }
  if (ok && !writer->finish()) {
    std::cerr << "[write] " << writer->error() << "\n";
    rc = 2;
  }
  stages.end_stage("stream");

  const double wall_ms = ch::duration<double, std::milli>(ch::steady_clock::now() - t0).count();
  const cp::RunStats st = stream->metrics().snapshot(wall_ms);

  // --- run.json
  if (!cli.report.empty()) {
    cp::RunJsonPayload p{};
    p.units = st.units;
    p.messages_in = st.messages;
    p.messages_out = writer->written();
    p.dropped = st.dropped;
    p.filtered = filtered;
    p.merged = merger.merged();
    p.errors_skipped = st.errors_skipped;
    p.errors_surfaced = st.errors_surfaced;
    p.bytes = st.bytes;
    p.wall_time_ms = wall_ms;
    p.throughput_mb_s = st.throughput_mb_s;
    p.messages_per_sec = st.messages_per_sec;
    p.peak_record_bytes = stream->peak_record_bytes();
    for (auto& s : stages.snapshot(wall_ms).stages) p.stage_times.emplace_back(s.name, s.duration_ms);
    p.errors_by_kind = st.errors_by_kind;
    p.filename = cli.input;
    p.platform = cp::platform_name(cli.platform);
    p.output = cli.output;
    p.output_format = cp::output_format_name(fmt);
    std::error_code fec;
    auto fsz = std::filesystem::file_size(cli.input, fec);
    p.file_size = fec ? 0 : static_cast<std::uint64_t>(fsz);

    std::ofstream rep(cli.report, std::ios::binary | std::ios::trunc);
    if (!(rep << cp::RunJsonWriter::to_json(p) << "\n")) {
      std::cerr << "[report] cannot write " << cli.report << "\n";
      if (rc == 0) rc = 2;
    }
  }

  if (rc == 0) {
    std::cout << "[write] ok: " << cli.input << " -> " << cli.output
              << " (" << writer->written() << " messages, "
              << st.errors_skipped << " skipped records)\n";
  }
  return rc;
}

}

int main(int argc, char** argv) {
  try {
    Cli cli = parse_cli(argc, argv);
    return run(cli);
  } catch (const UsageError& e) {
    std::cerr << "chatpack: " << e.what() << "\n" << kUsage;
    return 1;
  } catch (const std::logic_error& e) {
    // std::stoull on a non-numeric flag value
    std::cerr << "chatpack: invalid number (" << e.what() << ")\n" << kUsage;
    return 1;
  }
}
