#include "juggl/delimiter.hpp"

namespace juggl {

static int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

bool self_overlaps(Delimiter delim) noexcept {
  for (std::size_t k = 1; k < delim.size(); ++k) {
    if (delim.compare(0, k, delim, delim.size() - k, k) == 0) return true;
  }
  return false;
}

std::string decode_escapes(std::string_view text) {
  std::string out;
  out.reserve(text.size());
  std::size_t i = 0;
  while (i < text.size()) {
    const char c = text[i];
    if (c != '\\' || i + 1 >= text.size()) {
      out.push_back(c);
      ++i;
      continue;
    }
    const char e = text[i + 1];
    switch (e) {
      case 'n': out.push_back('\n'); i += 2; break;
      case 'r': out.push_back('\r'); i += 2; break;
      case 't': out.push_back('\t'); i += 2; break;
      case '0': out.push_back('\0'); i += 2; break;
      case 'x': {
        // need both digits; otherwise emit the backslash and move on
        const int hi = (i + 2 < text.size()) ? hex_value(text[i + 2]) : -1;
        const int lo = (i + 3 < text.size()) ? hex_value(text[i + 3]) : -1;
        if (hi >= 0 && lo >= 0) {
          out.push_back(static_cast<char>((hi << 4) | lo));
          i += 4;
        } else {
          out.push_back('\\');
          i += 1;
        }
        break;
      }
      default: out.push_back(e); i += 2; break;
    }
  }
  return out;
}

}
