#include "juggl/config.hpp"
#include "juggl/delimiter.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <simdjson.h>
#include <fast_float/fast_float.h>

namespace juggl {

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

static std::optional<double> unit_scale(std::string_view u) {
  if (u.empty() || ieq(u, "b")) return 1.0;
  if (ieq(u, "k") || ieq(u, "kb") || ieq(u, "kib")) return 1024.0;
  if (ieq(u, "m") || ieq(u, "mb") || ieq(u, "mib")) return 1024.0 * 1024.0;
  if (ieq(u, "g") || ieq(u, "gb") || ieq(u, "gib")) return 1024.0 * 1024.0 * 1024.0;
  return std::nullopt;
}

std::optional<std::size_t> parse_size(std::string_view s) {
  if (s.empty()) return std::nullopt;
  double v = 0.0;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), v);
  if (ec != std::errc() || ptr == s.data()) return std::nullopt;
  auto scale = unit_scale(std::string_view(ptr, static_cast<size_t>(s.data() + s.size() - ptr)));
  if (!scale) return std::nullopt;
  const double bytes = std::floor(v * *scale);
  if (!std::isfinite(bytes) || bytes < 0.0 ||
      bytes >= static_cast<double>(std::numeric_limits<std::size_t>::max())) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(bytes);
}

std::optional<std::uint64_t> parse_seed(std::string_view s) {
  int base = 10;
  if (s.size() > 2 && s[0] == '0' && (s[1] == 'x' || s[1] == 'X')) { s.remove_prefix(2); base = 16; }
  if (s.empty()) return std::nullopt;
  std::uint64_t v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v, base);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

std::optional<unsigned> parse_count(std::string_view s) {
  if (s.empty()) return std::nullopt;
  unsigned v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v, 10);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return v;
}

namespace {

bool set_err(std::string* err_out, std::string msg) {
  if (err_out) *err_out = std::move(msg);
  return false;
}

// Accept a JSON string (run through `parse`) or an unsigned integer.
template <class T, class Parse>
bool read_number_like(simdjson::ondemand::value v, Parse parse, T* out) {
  simdjson::ondemand::json_type t;
  if (v.type().get(t)) return false;
  if (t == simdjson::ondemand::json_type::string) {
    std::string_view s;
    if (v.get_string().get(s)) return false;
    auto parsed = parse(s);
    if (!parsed) return false;
    *out = static_cast<T>(*parsed);
    return true;
  }
  if (t == simdjson::ondemand::json_type::number) {
    std::uint64_t u = 0;
    if (v.get_uint64().get(u)) return false;
    if (u > std::numeric_limits<T>::max()) return false;
    *out = static_cast<T>(u);
    return true;
  }
  return false;
}

bool read_string(simdjson::ondemand::value v, std::string* out) {
  std::string_view s;
  if (v.get_string().get(s)) return false;
  out->assign(s.data(), s.size());
  return true;
}

}

bool load_config_json(const std::string& path, Config* cfg, std::string* err_out) {
  simdjson::padded_string json;
  if (auto e = simdjson::padded_string::load(path).get(json)) {
    return set_err(err_out, "cannot read " + path + ": " + simdjson::error_message(e));
  }

  simdjson::ondemand::parser parser;
  simdjson::ondemand::document doc;
  simdjson::ondemand::object obj;
  if (auto e = parser.iterate(json).get(doc)) {
    return set_err(err_out, path + ": " + simdjson::error_message(e));
  }
  if (auto e = doc.get_object().get(obj)) {
    return set_err(err_out, path + ": top level must be an object (" + simdjson::error_message(e) + ")");
  }

  for (auto field : obj) {
    std::string_view key;
    if (auto e = field.unescaped_key().get(key)) {
      return set_err(err_out, path + ": " + simdjson::error_message(e));
    }
    const std::string k(key);
    simdjson::ondemand::value v;
    if (auto e = field.value().get(v)) {
      return set_err(err_out, path + ": key '" + k + "': " + simdjson::error_message(e));
    }

    bool ok = false;
    if (k == "input") {
      ok = read_string(v, &cfg->input);
    } else if (k == "output") {
      ok = read_string(v, &cfg->output);
    } else if (k == "report") {
      ok = read_string(v, &cfg->report);
    } else if (k == "delimiter") {
      std::string raw;
      ok = read_string(v, &raw);
      if (ok) { cfg->delimiter = decode_escapes(raw); cfg->delimiter_set = true; }
    } else if (k == "seed") {
      std::uint64_t s = 0;
      ok = read_number_like(v, parse_seed, &s);
      if (ok) cfg->seed = s;
    } else if (k == "threads") {
      ok = read_number_like(v, parse_count, &cfg->threads);
    } else if (k == "range_size") {
      ok = read_number_like(v, parse_size, &cfg->range_bytes);
    } else if (k == "materialize_below") {
      ok = read_number_like(v, parse_seed, &cfg->materialize_below);
    } else if (k == "strategy") {
      std::string s;
      ok = read_string(v, &s) && parse_strategy(s, &cfg->strategy);
    } else if (k == "verbose") {
      bool b = false;
      ok = !v.get_bool().get(b);
      if (ok) cfg->verbose = b;
    } else {
      return set_err(err_out, path + ": unknown key '" + k + "'");
    }
    if (!ok) return set_err(err_out, path + ": invalid value for '" + k + "'");
  }
  return true;
}

}
