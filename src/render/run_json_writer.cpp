#include "chatpack/run_json.hpp"
#include <cmath> // std::isfinite
#include <cstdio>
#include <sstream>

namespace cp {

void json_escape(std::ostream& o, std::string_view s) {
  o << '"';
  for (char c : s) {
    switch (c) {
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      case '\b': o << "\\b";  break;
      case '\f': o << "\\f";  break;
      default:
        if (static_cast<unsigned char>(c) < 0x20) {
          char buf[8];
          std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(static_cast<unsigned char>(c)));
          o << buf;
        } else {
          o << c;
        }
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"units\":" << p.units << ",";
  o << "\"messages_in\":" << p.messages_in << ",";
  o << "\"messages_out\":" << p.messages_out << ",";
  o << "\"dropped\":" << p.dropped << ",";
  o << "\"filtered\":" << p.filtered << ",";
  o << "\"merged\":" << p.merged << ",";
  o << "\"errors_skipped\":" << p.errors_skipped << ",";
  o << "\"errors_surfaced\":" << p.errors_surfaced << ",";
  o << "\"bytes\":" << p.bytes << ",";
  o << "\"wall_time_ms\":" << safe_num(p.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(p.throughput_mb_s) << ",";
  o << "\"messages_per_sec\":" << safe_num(p.messages_per_sec) << ",";
  o << "\"peak_record_bytes\":" << p.peak_record_bytes << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<p.stage_times.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; json_escape(o, p.stage_times[i].first);
    o << ",\"duration_ms\":" << p.stage_times[i].second << "}";
  }
  o << "],";

  o << "\"errors_by_kind\":{";
  bool first=true;
  for (auto& kv : p.errors_by_kind) {
    if (!first) o << ",";
    first=false;
    json_escape(o, kv.first); o << ":" << kv.second;
  }
  o << "},";

  o << "\"filename\":";      json_escape(o, p.filename);      o << ",";
  o << "\"platform\":";      json_escape(o, p.platform);      o << ",";
  o << "\"output\":";        json_escape(o, p.output);        o << ",";
  o << "\"output_format\":"; json_escape(o, p.output_format); o << ",";
  o << "\"file_size\":" << p.file_size;

  o << "}";
  return o.str();
}

}
