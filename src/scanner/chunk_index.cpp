#include "juggl/chunk_index.hpp"

#include <stdexcept>
#include <string>

namespace juggl {

ChunkIndex build_chunk_index(std::size_t buffer_len, const OffsetSet& offsets,
                             std::size_t delim_len) {
  ChunkIndex out;
  if (buffer_len == 0 || offsets.empty()) return out;

  out.reserve(offsets.size());
  if (offsets.back() > buffer_len) {
    throw std::invalid_argument("offset beyond buffer end");
  }
  for (std::size_t i = 0; i + 1 < offsets.size(); ++i) {
    const std::uint64_t next = offsets[i + 1];
    if (next < offsets[i] + delim_len || next > buffer_len) {
      throw std::invalid_argument("offset set not increasing at index " + std::to_string(i + 1));
    }
    out.push_back(Chunk{offsets[i], next - delim_len});
  }
  // a trailing delimiter leaves an empty last record
  out.push_back(Chunk{offsets.back(), buffer_len});
  return out;
}

}
