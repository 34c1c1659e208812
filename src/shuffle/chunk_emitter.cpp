#include "juggl/chunk_emitter.hpp"
#include "juggl/errors.hpp"

#include <ostream>
#include <stdexcept>
#include <string>

namespace juggl {

template <class SourceOf>
EmitStats ChunkEmitter::walk(std::uint64_t n, SourceOf source_of, const ByteSink& sink) const {
  EmitStats st;
  bool need_sep = false;
  for (std::uint64_t k = 0; k < n; ++k) {
    std::string_view rec = chunk_bytes(buf_, index_[source_of(k)]);
    if (starts_with(rec, delim_)) rec.remove_prefix(delim_.size());
    if (rec.empty()) { ++st.empty_skipped; continue; }

    if (need_sep) {
      sink(delim_);
      st.bytes += delim_.size();
    }
    sink(rec);
    st.bytes += rec.size();
    ++st.records;
    // a record that already ends with the delimiter supplies its own separator
    need_sep = !ends_with(rec, delim_);
  }
  return st;
}

EmitStats ChunkEmitter::emit(const Permutation& perm, const ByteSink& sink) const {
  if (perm.size() != index_.size()) {
    throw std::invalid_argument("permutation size " + std::to_string(perm.size()) +
                                " != chunk count " + std::to_string(index_.size()));
  }
  return walk(perm.size(), [&](std::uint64_t k) { return perm.at(k); }, sink);
}

ChunkEmitter::ByteSink ostream_sink(std::ostream& out) {
  return [&out](std::string_view bytes) {
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!out) throw WriteError("output stream rejected write");
  };
}

}
