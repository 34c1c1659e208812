#include "juggl/config.hpp"
#include "juggl/delimiter.hpp"
#include "juggl/permutation.hpp"
#include "juggl/shuffler.hpp"

#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

namespace {

constexpr int kUsageError = 1;

const char* kUsage =
  "Usage: juggl <input> -d <delimiter> [-s <seed>] [-t <threads>]\n"
  "             [--range-size=SIZE] [--strategy=lazy|shuffle|auto]\n"
  "             [--materialize-below=N] [-o <output>] [--report=<run.json>]\n"
  "             [--config=<file.json>] [-v]\n"
  "Shuffles delimiter-separated records of <input>. The delimiter accepts\n"
  "escapes: \\n \\r \\t \\0 \\xHH.\n";

struct CliError {
  int code = 0;
  std::string msg;
};

// Returns false and fills `err` on a bad command line.
bool parse_cli(int argc, char** argv, juggl::Config& c, CliError& err) {
  // config file first so flags override it
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    if (a.rfind("--config=", 0) == 0) {
      std::string e;
      if (!juggl::load_config_json(a.substr(9), &c, &e)) {
        err = {static_cast<int>(juggl::RunStatus::ParamError), e};
        return false;
      }
    }
  }

  auto bad_value = [&](const std::string& flag, const std::string& v) {
    err = {static_cast<int>(juggl::RunStatus::ParamError), "invalid value for " + flag + ": '" + v + "'"};
    return false;
  };

  bool have_positional = false; // an input from --config is only a default
  for (int i = 1; i < argc; ++i) {
    std::string a(argv[i]);
    // "--name=value", or "-x value" / "--name value"
    auto take = [&](const char* shrt, const char* lng, std::string* out) {
      const std::string eq = std::string(lng) + "=";
      if (a.rfind(eq, 0) == 0) { *out = a.substr(eq.size()); return true; }
      if (((*shrt && a == shrt) || a == lng) && i + 1 < argc) { *out = argv[++i]; return true; }
      return false;
    };

    std::string v;
    if (a.rfind("--config=", 0) == 0) continue;
    if (a == "-h" || a == "--help") { std::cout << kUsage; std::exit(0); }
    if (a == "-v" || a == "--verbose") { c.verbose = true; continue; }
    if (take("-d", "--delimiter", &v)) {
      c.delimiter = juggl::decode_escapes(v);
      c.delimiter_set = true;
      continue;
    }
    if (take("-s", "--seed", &v)) {
      auto s = juggl::parse_seed(v);
      if (!s) return bad_value("--seed", v);
      c.seed = *s;
      continue;
    }
    if (take("-t", "--threads", &v)) {
      auto n = juggl::parse_count(v);
      if (!n) return bad_value("--threads", v);
      c.threads = *n;
      continue;
    }
    if (take("", "--range-size", &v)) {
      auto n = juggl::parse_size(v);
      if (!n) return bad_value("--range-size", v);
      c.range_bytes = *n;
      continue;
    }
    if (take("", "--strategy", &v)) {
      if (!juggl::parse_strategy(v, &c.strategy)) return bad_value("--strategy", v);
      continue;
    }
    if (take("", "--materialize-below", &v)) {
      auto n = juggl::parse_seed(v);
      if (!n) return bad_value("--materialize-below", v);
      c.materialize_below = *n;
      continue;
    }
    if (take("-o", "--output", &v)) { c.output = v; continue; }
    if (take("", "--report", &v))   { c.report = v; continue; }

    if (a.size() > 1 && a[0] == '-') {
      err = {kUsageError, "unknown option " + a};
      return false;
    }
    if (have_positional) {
      err = {kUsageError, "more than one input file"};
      return false;
    }
    have_positional = true;
    c.input = a;
  }

  if (c.input.empty() || !c.delimiter_set) {
    err = {kUsageError, "missing input file or delimiter"};
    return false;
  }
  return true;
}

}

int main(int argc, char** argv) {
  std::ios::sync_with_stdio(false);

  juggl::Config cfg;
  CliError err;
  if (!parse_cli(argc, argv, cfg, err)) {
    std::cerr << "[config] " << err.msg << "\n";
    if (err.code == kUsageError) std::cerr << kUsage;
    return err.code;
  }

  juggl::Shuffler shuffler(std::move(cfg));
  return static_cast<int>(shuffler.run());
}
