#include "juggl/run_json.hpp"
#include <sstream>
#include <cmath> // std::isfinite

namespace juggl {

static void esc(std::ostringstream& o, const std::string& s){
  static const char* hex = "0123456789abcdef";
  o << '"';
  for (char ch : s){
    unsigned char c = static_cast<unsigned char>(ch);
    switch(c){
      case '\\': o << "\\\\"; break;
      case '"':  o << "\\\""; break;
      case '\n': o << "\\n";  break;
      case '\r': o << "\\r";  break;
      case '\t': o << "\\t";  break;
      default:
        if (c < 0x20) o << "\\u00" << hex[c >> 4] << hex[c & 0xF];
        else o << ch;
        break;
    }
  }
  o << '"';
}

static inline double safe_num(double v){ return std::isfinite(v) ? v : 0.0; }

std::string RunJsonWriter::to_json(const RunJsonPayload& p) {
  std::ostringstream o;
  o << "{";
  o << "\"records\":" << p.records << ",";
  o << "\"empty_records\":" << p.empty_records << ",";
  o << "\"bytes\":" << p.bytes << ",";
  o << "\"output_bytes\":" << p.output_bytes << ",";
  o << "\"wall_time_ms\":" << safe_num(p.wall_time_ms) << ",";
  o << "\"throughput_mb_s\":" << safe_num(p.throughput_mb_s) << ",";

  o << "\"stage_times\":[";
  for (size_t i=0;i<p.stage_times.size();++i){
    if (i) o << ",";
    o << "{\"stage\":"; esc(o, p.stage_times[i].first);
    o << ",\"duration_ms\":" << safe_num(p.stage_times[i].second) << "}";
  }
  o << "],";

  // seeds are full 64-bit; the string form survives any JSON reader
  o << "\"seed\":"; esc(o, std::to_string(p.seed)); o << ",";
  o << "\"seed_source\":"; esc(o, p.seed_source); o << ",";
  o << "\"strategy\":";    esc(o, p.strategy);    o << ",";
  o << "\"threads\":" << p.threads << ",";
  o << "\"ranges\":" << p.ranges << ",";
  o << "\"range_bytes\":" << p.range_bytes << ",";
  o << "\"delimiter_len\":" << p.delimiter_len << ",";

  o << "\"filename\":";      esc(o, p.filename);      o << ",";
  o << "\"file_size\":" << p.file_size << ",";
  o << "\"output_sha256\":"; esc(o, p.output_sha256);

  o << "}";
  return o.str();
}

}
