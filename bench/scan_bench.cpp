#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "juggl/chunk_index.hpp"
#include "juggl/delimiter.hpp"
#include "juggl/mapped_file.hpp"
#include "juggl/occurrence_scanner.hpp"
#include "juggl/permutation.hpp"

namespace fs = std::filesystem;
using clk = std::chrono::steady_clock;

static std::string make_synth_lines(std::size_t rows, std::size_t cols) {
  fs::path p = fs::temp_directory_path() / "juggl_bench_synth.txt";
  std::ofstream out(p, std::ios::binary);
  for (size_t r = 0; r < rows; ++r) {
    for (size_t c = 0; c < cols; ++c) {
      out << (r%10) << "." << (c*37%1000);
      if (c+1<cols) out << ",";
    }
    out << "\n";
  }
  out.flush();
  return p.string();
}

struct Args {
  std::string path;            // if empty -> synth
  std::string delimiter = "\n";
  std::size_t rows = 2'000'000; // for synth
  std::size_t cols = 8;         // for synth
  int iters = 3;
};

static Args parse_args(int argc, char** argv) {
  Args a;
  for (int i=1;i<argc;++i){
    std::string s(argv[i]);
    auto eq = s.find('=');
    auto key = s.substr(0, eq);
    auto val = (eq==std::string::npos) ? "" : s.substr(eq+1);
    if (key=="--input") a.path = val;
    else if (key=="--delimiter") a.delimiter = juggl::decode_escapes(val);
    else if (key=="--rows") a.rows = std::stoull(val);
    else if (key=="--cols") a.cols = std::stoull(val);
    else if (key=="--iters") a.iters = std::stoi(val);
    else if (key=="--help" || key=="-h") {
      std::cout <<
        "Usage: juggl_bench_scan [--input=path] [--delimiter=ESC] [--rows=N] [--cols=M] [--iters=K]\n"
        "If --input is omitted, a synthetic newline-separated file is generated.\n";
      std::exit(0);
    }
  }
  return a;
}

static void bench_scan(std::string_view buf, const std::string& delim, unsigned threads, int iters) {
  const std::size_t range = juggl::default_range_bytes(buf.size(), threads);
  std::cout << "\n[scan] threads=" << threads << " range_bytes=" << range << "\n";
  for (int k=1;k<=iters;++k) {
    juggl::ScanConfig cfg;
    cfg.threads = threads;
    cfg.range_bytes = range;
    auto t0 = clk::now();
    auto offsets = juggl::find_record_starts(buf, delim, cfg);
    auto idx = juggl::build_chunk_index(buf.size(), offsets, delim.size());
    auto t1 = clk::now();

    const double sec = std::chrono::duration<double>(t1-t0).count();
    const double mib = buf.size() / (1024.0*1024.0);
    std::cout << "  iter " << k
              << ": chunks=" << idx.size()
              << " time=" << sec << "s"
              << "  throughput=" << (mib/sec) << " MiB/s\n";
  }
}

static void bench_permutation(std::uint64_t n, juggl::PermutationStrategy s) {
  auto t0 = clk::now();
  auto perm = juggl::make_permutation(s, 42, n);
  std::uint64_t acc = 0;
  for (std::uint64_t k = 0; k < n; ++k) acc += perm->at(k);
  auto t1 = clk::now();
  const double sec = std::chrono::duration<double>(t1-t0).count();
  std::cout << "[perm] " << juggl::to_string(s) << " n=" << n
            << " time=" << sec << "s  rate=" << (n/sec)/1e6 << " M/s"
            << "  (checksum " << acc << ")\n";
}

int main(int argc, char** argv){
  Args a = parse_args(argc, argv);

  std::string path = a.path;
  if (path.empty() || !fs::exists(path)) path = make_synth_lines(a.rows, a.cols);

  juggl::MappedFile file;
  if (!file.open(path)) { std::cerr << "[bench] " << file.error() << "\n"; return 2; }

  for (unsigned t : {1u, 2u, 4u, juggl::resolve_threads(0)})
    bench_scan(file.bytes(), a.delimiter, t, a.iters);

  std::cout << "\n";
  bench_permutation(a.rows, juggl::PermutationStrategy::Lazy);
  bench_permutation(a.rows, juggl::PermutationStrategy::Materialized);
  return 0;
}
