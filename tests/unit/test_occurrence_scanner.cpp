#include "juggl/occurrence_scanner.hpp"
#include <atomic>
#include <cstdint>
#include <iostream>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

using juggl::OffsetSet;

static int failed = 0;

static std::string show(const OffsetSet& v) {
  std::string s = "{";
  for (size_t i = 0; i < v.size(); ++i) { if (i) s += ","; s += std::to_string(v[i]); }
  return s + "}";
}

static void expect(const std::string& buf, const std::string& delim, const OffsetSet& want) {
  // every partitioning must agree with the expected set
  for (std::size_t range : {std::size_t{1}, std::size_t{2}, std::size_t{3}, std::size_t{1000000}}) {
    for (unsigned threads : {1u, 4u}) {
      juggl::ScanConfig cfg;
      cfg.range_bytes = range;
      cfg.threads = threads;
      OffsetSet got = juggl::find_record_starts(buf, delim, cfg);
      if (got != want) {
        ++failed;
        std::cerr << "[FAIL] '" << buf << "' / '" << delim << "' range=" << range
                  << " threads=" << threads << " got " << show(got) << " want " << show(want) << "\n";
      }
    }
  }
  if (juggl::find_record_starts_sequential(buf, delim) != want) {
    ++failed;
    std::cerr << "[FAIL] sequential '" << buf << "' / '" << delim << "'\n";
  }
}

// Fuzz: parallel result equals the sequential one for any partitioning.
static void fuzz(const std::string& alphabet, const std::string& delim, int rounds) {
  std::mt19937_64 rng(7);
  std::uniform_int_distribution<std::size_t> len_d(0, 300), pick(0, alphabet.size() - 1);
  std::uniform_int_distribution<std::size_t> range_d(1, 40);
  std::uniform_int_distribution<unsigned> thr_d(1, 8);
  for (int r = 0; r < rounds; ++r) {
    std::string buf(len_d(rng), ' ');
    for (auto& c : buf) c = alphabet[pick(rng)];
    const OffsetSet want = juggl::find_record_starts_sequential(buf, delim);
    juggl::ScanConfig cfg;
    cfg.range_bytes = range_d(rng);
    cfg.threads = thr_d(rng);
    juggl::ScanStats st;
    const OffsetSet got = juggl::find_record_starts(buf, delim, cfg, &st);
    if (got != want) {
      ++failed;
      std::cerr << "[FAIL] fuzz delim='" << delim << "' buf='" << buf << "' range=" << cfg.range_bytes
                << " got " << show(got) << " want " << show(want) << "\n";
      return;
    }
    if (st.workers > cfg.threads || st.workers > st.ranges) {
      ++failed;
      std::cerr << "[FAIL] fuzz worker count " << st.workers << "\n";
      return;
    }
  }
}

int main(){
  expect("hello world", "", {0});
  expect("a,b,c,d", ",", {0, 2, 4, 6});
  expect("foo::bar::baz", "::", {0, 5, 10});
  expect("hello world", "xyz", {0});
  expect(",a,b,c", ",", {0, 1, 3, 5});
  expect("a,b,c,", ",", {0, 2, 4, 6});
  expect("a,,b", ",", {0, 2, 3});
  expect("", ",", {0});
  expect("ab", "abc", {0});
  expect("aaa", "aa", {0, 2});
  expect("aaaa", "aa", {0, 2, 4});
  expect("aaaaa", "aa", {0, 2, 4});
  expect("abababa", "aba", {0, 3, 7});
  expect("x\r\ny\r\n\r\nz", "\r\n", {0, 3, 6, 8});

  fuzz("ab", "aa", 400);
  fuzz("ab", "aba", 400);
  fuzz("ab,", ",", 400);
  fuzz("abc", "abcab", 400);
  fuzz("ab", "ab", 400);
  fuzz("aab", "aaa", 400);

  // long runs of a self-overlapping delimiter: the matching chain must not
  // drift with the range boundaries
  for (const std::string delim : {"aa", "aaa", "abab"}) {
    std::string buf;
    while (buf.size() < 10007) buf += delim;
    buf += "a";
    const OffsetSet want = juggl::find_record_starts_sequential(buf, delim);
    if (want.size() != buf.size() / delim.size() + 1) {
      ++failed;
      std::cerr << "[FAIL] run of '" << delim << "' sequential matches " << want.size() - 1 << "\n";
    }
    for (std::size_t range : {std::size_t{1}, std::size_t{2}, std::size_t{3}, std::size_t{5}, std::size_t{7}, std::size_t{1000}}) {
      juggl::ScanConfig cfg; cfg.range_bytes = range; cfg.threads = 4;
      if (juggl::find_record_starts(buf, delim, cfg) != want) {
        ++failed;
        std::cerr << "[FAIL] run of '" << delim << "' range=" << range << "\n";
      }
    }
  }

  // every range index runs exactly once
  for (unsigned threads : {1u, 3u, 8u}) {
    std::vector<std::atomic<int>> seen(257);
    unsigned used = juggl::run_ranges(seen.size(), threads, [&](std::size_t k) { seen[k].fetch_add(1); });
    bool once = true;
    for (auto& n : seen) once &= (n.load() == 1);
    if (!once || used == 0 || used > threads) {
      ++failed;
      std::cerr << "[FAIL] run_ranges threads=" << threads << " used=" << used << "\n";
    }
  }
  if (juggl::run_ranges(0, 4, [](std::size_t) {}) != 0) { ++failed; std::cerr << "[FAIL] run_ranges empty\n"; }

  // a failing range aborts the whole run and surfaces on the caller
  for (unsigned threads : {1u, 4u}) {
    std::atomic<int> ran{0};
    bool threw = false;
    try {
      (void)juggl::run_ranges(1000, threads, [&](std::size_t k) {
        ran.fetch_add(1);
        if (k == 37) throw std::runtime_error("range 37 unreadable");
      });
    } catch (const std::runtime_error& e) {
      threw = std::string(e.what()) == "range 37 unreadable";
    }
    if (!threw || ran.load() >= 1000) {
      ++failed;
      std::cerr << "[FAIL] range failure threads=" << threads << " threw=" << threw << " ran=" << ran.load() << "\n";
    }
  }

  // range straddling: one match per boundary position
  {
    std::string buf(64, 'x');
    buf.replace(30, 4, "<||>");
    for (std::size_t range = 1; range <= 40; ++range) {
      juggl::ScanConfig cfg; cfg.range_bytes = range; cfg.threads = 3;
      if (juggl::find_record_starts(buf, "<||>", cfg) != OffsetSet{0, 34}) {
        ++failed;
        std::cerr << "[FAIL] straddling match lost at range=" << range << "\n";
      }
    }
  }

  {
    juggl::ScanConfig cfg; cfg.range_bytes = 4; cfg.threads = 2;
    juggl::ScanStats st;
    (void)juggl::find_record_starts("a,b,c,d,e,f", ",", cfg, &st);
    if (st.ranges != 3 || st.workers != 2 || st.matches != 5) {
      ++failed;
      std::cerr << "[FAIL] stats ranges=" << st.ranges << " workers=" << st.workers
                << " matches=" << st.matches << "\n";
    }
  }

  if (juggl::default_range_bytes(10, 4) != 1000 * 1000) { ++failed; std::cerr << "[FAIL] range floor\n"; }
  if (juggl::default_range_bytes(80u * 1000 * 1000, 4) != 20u * 1000 * 1000) { ++failed; std::cerr << "[FAIL] range split\n"; }
  if (juggl::resolve_threads(0) == 0) { ++failed; std::cerr << "[FAIL] resolve_threads(0)\n"; }

  if (failed) { std::cerr << "[FAIL] " << failed << " scanner checks\n"; return 1; }
  std::cout << "[PASS] occurrence scanner\n";
  return 0;
}
