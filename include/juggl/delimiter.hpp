#pragma once
#include <cstddef>
#include <string>
#include <string_view>

namespace juggl {

// Raw delimiter bytes. An empty delimiter means "whole buffer is one record".
using Delimiter = std::string_view;

// True iff `delim` occurs in `buf` starting at `offset`. Never true for an
// empty delimiter.
inline bool matches(std::string_view buf, std::size_t offset, Delimiter delim) noexcept {
  if (delim.empty()) return false;
  if (offset > buf.size() || buf.size() - offset < delim.size()) return false;
  return buf.compare(offset, delim.size(), delim) == 0;
}

inline bool starts_with(std::string_view s, Delimiter delim) noexcept {
  return matches(s, 0, delim);
}

inline bool ends_with(std::string_view s, Delimiter delim) noexcept {
  return !delim.empty() && s.size() >= delim.size() &&
         matches(s, s.size() - delim.size(), delim);
}

// A delimiter self-overlaps when some proper prefix equals a proper suffix
// ("aa", "aba", "abcab"). Two occurrences of such a delimiter can share bytes.
bool self_overlaps(Delimiter delim) noexcept;

// Decode a human-typed delimiter: \n \r \t \0 \xHH and \<c> -> <c>.
// Malformed \x sequences keep the backslash literally.
std::string decode_escapes(std::string_view text);

}
