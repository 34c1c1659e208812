#include "juggl/delimiter.hpp"
#include <iostream>
#include <string>

using namespace std::string_literals;

static int failed = 0;

static void check(bool ok, const std::string& what) {
  if (ok) return;
  ++failed;
  std::cerr << "[FAIL] " << what << "\n";
}

int main(){
  // matcher
  check(juggl::matches("a,b", 1, ","), "match in the middle");
  check(!juggl::matches("a,b", 0, ","), "no match on a different byte");
  check(juggl::matches("foo::bar", 3, "::"), "multi-byte match");
  check(!juggl::matches("foo:", 3, "::"), "match cut off by the buffer end");
  check(!juggl::matches("abc", 4, "a"), "offset past the end");
  check(!juggl::matches("abc", 0, ""), "empty delimiter never matches");
  check(juggl::matches("x\0y"s, 1, "\0"s), "nul delimiter");

  check(juggl::ends_with("ab,", ","), "ends_with");
  check(!juggl::ends_with("", ","), "ends_with on empty");
  check(juggl::starts_with("::x", "::"), "starts_with");

  // self overlap
  check(juggl::self_overlaps("aa"), "aa overlaps");
  check(juggl::self_overlaps("aba"), "aba overlaps");
  check(juggl::self_overlaps("abcab"), "abcab overlaps");
  check(!juggl::self_overlaps(","), "single byte does not overlap");
  check(!juggl::self_overlaps("ab"), "ab does not overlap");
  check(!juggl::self_overlaps("\r\n"), "CRLF does not overlap");

  // escapes
  check(juggl::decode_escapes("abc") == "abc", "plain text");
  check(juggl::decode_escapes("\\n") == "\n", "\\n");
  check(juggl::decode_escapes("\\r") == "\r", "\\r");
  check(juggl::decode_escapes("\\t") == "\t", "\\t");
  check(juggl::decode_escapes("\\0") == "\0"s, "\\0");
  check(juggl::decode_escapes("\\x00") == "\0"s, "\\x00");
  check(juggl::decode_escapes("\\x41") == "A", "\\x41");
  check(juggl::decode_escapes("\\xff") == "\xff", "\\xff");
  check(juggl::decode_escapes("\\xFF") == "\xff", "\\xFF");
  check(juggl::decode_escapes("a\\nb") == "a\nb", "mixed");
  check(juggl::decode_escapes("\\x00,\\x01") == "\0,\x01"s, "hex mixed");
  check(juggl::decode_escapes("\\xgg") == "\\xgg", "bad hex kept");
  check(juggl::decode_escapes("\\x1") == "\\x1", "short hex kept");
  check(juggl::decode_escapes("\\\\") == "\\", "escaped backslash");
  check(juggl::decode_escapes("\\a") == "a", "unknown escape");
  check(juggl::decode_escapes("a\\") == "a\\", "trailing backslash");

  if (failed) { std::cerr << "[FAIL] " << failed << " delimiter checks\n"; return 1; }
  std::cout << "[PASS] delimiter\n";
  return 0;
}
