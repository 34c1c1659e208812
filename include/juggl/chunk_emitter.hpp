#pragma once
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <string_view>

#include "juggl/chunk_index.hpp"
#include "juggl/delimiter.hpp"
#include "juggl/permutation.hpp"

namespace juggl {

struct EmitStats {
  std::uint64_t records = 0;       // non-empty records written
  std::uint64_t empty_skipped = 0;
  std::uint64_t bytes = 0;         // including separators
};

class ChunkEmitter {
public:
  // Receives output bytes in order; throws WriteError on failure.
  using ByteSink = std::function<void(std::string_view)>;

  ChunkEmitter(std::string_view buffer, const ChunkIndex& index, Delimiter delim)
      : buf_(buffer), index_(index), delim_(delim) {}

  // Write index[perm(k)] for k = 0..n-1, one delimiter copy between
  // consecutive non-empty records, none after the last.
  // perm.size() must equal index.size().
  EmitStats emit(const Permutation& perm, const ByteSink& sink) const;

private:
  template <class SourceOf>
  EmitStats walk(std::uint64_t n, SourceOf source_of, const ByteSink& sink) const;

  std::string_view buf_;
  const ChunkIndex& index_;
  Delimiter delim_;
};

// Sink over a std::ostream; throws WriteError once the stream goes bad.
ChunkEmitter::ByteSink ostream_sink(std::ostream& out);

}
