#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#include "juggl/occurrence_scanner.hpp"

namespace juggl {

// Half-open byte interval of one record, delimiter excluded.
struct Chunk {
  std::uint64_t start = 0;
  std::uint64_t end   = 0;

  std::uint64_t size() const noexcept { return end - start; }
  bool empty() const noexcept { return start == end; }
};

inline bool operator==(const Chunk& a, const Chunk& b) noexcept {
  return a.start == b.start && a.end == b.end;
}

using ChunkIndex = std::vector<Chunk>;

// One interval per record: (o_i, o_{i+1} - |delim|) for consecutive offsets,
// then (last, buffer_len), which is empty when the buffer ends in the
// delimiter. Joining the intervals with the delimiter gives back the buffer.
// An empty buffer has no records.
ChunkIndex build_chunk_index(std::size_t buffer_len, const OffsetSet& offsets,
                             std::size_t delim_len);

inline std::string_view chunk_bytes(std::string_view buf, const Chunk& c) noexcept {
  return buf.substr(static_cast<std::size_t>(c.start), static_cast<std::size_t>(c.size()));
}

}
