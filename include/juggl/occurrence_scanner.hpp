#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string_view>
#include <vector>

#include "juggl/delimiter.hpp"

namespace juggl {

// Sorted, deduplicated record-start offsets. Always begins with 0.
using OffsetSet = std::vector<std::uint64_t>;

struct ScanConfig {
  std::size_t range_bytes = 1000 * 1000; // nominal work range size
  unsigned    threads     = 0;           // 0 -> hardware concurrency
};

struct ScanStats {
  std::size_t ranges  = 0;
  unsigned    workers = 0;
  std::size_t matches = 0;
};

// Range size used when the caller does not pin one: at least `floor_bytes`,
// and coarse enough that each worker gets about one range.
std::size_t default_range_bytes(std::size_t buffer_len, unsigned threads,
                                std::size_t floor_bytes = 1000 * 1000);

unsigned resolve_threads(unsigned requested) noexcept;

// Run task(0) .. task(count-1) on up to `threads` workers (0 -> hardware
// concurrency), each index exactly once. The first exception stops the
// remaining ranges and is rethrown here after every worker has joined.
// Returns the number of workers used.
unsigned run_ranges(std::size_t count, unsigned threads,
                    const std::function<void(std::size_t)>& task);

// Locate every delimiter occurrence in `buf` using a pool of workers, one
// work range at a time, and return the start offset of each record.
// Matching is non-overlapping, leftmost first. The result does not depend on
// `cfg`. Worker failures are rethrown on the calling thread.
OffsetSet find_record_starts(std::string_view buf, Delimiter delim,
                             const ScanConfig& cfg = {},
                             ScanStats* stats = nullptr);

// Single-threaded reference scan; same contract as find_record_starts.
OffsetSet find_record_starts_sequential(std::string_view buf, Delimiter delim);

}
