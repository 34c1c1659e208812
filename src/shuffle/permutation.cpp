#include "juggl/permutation.hpp"

#include <random>
#include <stdexcept>
#include <string>
#include <utility>

namespace juggl {

const char* to_string(PermutationStrategy s) noexcept {
  switch (s) {
    case PermutationStrategy::Lazy:         return "lazy";
    case PermutationStrategy::Materialized: return "shuffle";
    case PermutationStrategy::Auto:         return "auto";
  }
  return "lazy";
}

bool parse_strategy(std::string_view s, PermutationStrategy* out) noexcept {
  if (s == "lazy" || s == "feistel")      { *out = PermutationStrategy::Lazy; return true; }
  if (s == "shuffle" || s == "materialized") { *out = PermutationStrategy::Materialized; return true; }
  if (s == "auto")                        { *out = PermutationStrategy::Auto; return true; }
  return false;
}

// ---------------- Feistel

FeistelPermutation::FeistelPermutation(std::uint64_t seed, std::uint64_t n) : n_(n) {
  if (n == 0) throw std::invalid_argument("permutation over zero chunks");
  unsigned bits = 2;
  while (bits < 64 && (std::uint64_t{1} << bits) < n) ++bits;
  if (bits & 1u) ++bits;
  half_bits_ = bits / 2;
  half_mask_ = (half_bits_ >= 64) ? ~std::uint64_t{0} : ((std::uint64_t{1} << half_bits_) - 1);

  std::uint64_t state = seed;
  for (auto& k : keys_) k = splitmix64(state);
}

std::uint64_t FeistelPermutation::encrypt(std::uint64_t x) const noexcept {
  std::uint64_t l = (x >> half_bits_) & half_mask_;
  std::uint64_t r = x & half_mask_;
  for (int i = 0; i < kRounds; ++i) {
    std::uint64_t nl = r;
    r = l ^ (mix64(keys_[i], r) & half_mask_);
    l = nl;
  }
  return (l << half_bits_) | r;
}

std::uint64_t FeistelPermutation::decrypt(std::uint64_t x) const noexcept {
  std::uint64_t l = (x >> half_bits_) & half_mask_;
  std::uint64_t r = x & half_mask_;
  for (int i = kRounds - 1; i >= 0; --i) {
    std::uint64_t pr = l;
    l = r ^ (mix64(keys_[i], l) & half_mask_);
    r = pr;
  }
  return (l << half_bits_) | r;
}

std::uint64_t FeistelPermutation::at(std::uint64_t k) const {
  if (k >= n_) throw std::out_of_range("permutation index " + std::to_string(k));
  // cycle walk: the domain is < 4n, so few extra steps are expected
  std::uint64_t v = encrypt(k);
  while (v >= n_) v = encrypt(v);
  return v;
}

std::uint64_t FeistelPermutation::inverse(std::uint64_t v) const {
  if (v >= n_) throw std::out_of_range("permutation value " + std::to_string(v));
  std::uint64_t k = decrypt(v);
  while (k >= n_) k = decrypt(k);
  return k;
}

// ---------------- Fisher-Yates

// Unbiased draw in [0, bound) from a 64-bit engine (rejection on the low tail).
static std::uint64_t bounded(std::mt19937_64& eng, std::uint64_t bound) {
  const std::uint64_t threshold = (0 - bound) % bound;
  for (;;) {
    const std::uint64_t r = eng();
    if (r >= threshold) return r % bound;
  }
}

MaterializedPermutation::MaterializedPermutation(std::uint64_t seed, std::uint64_t n) {
  if (n == 0) throw std::invalid_argument("permutation over zero chunks");
  order_.resize(n);
  for (std::uint64_t i = 0; i < n; ++i) order_[i] = i;
  std::mt19937_64 eng(seed);
  for (std::uint64_t i = n - 1; i > 0; --i) {
    std::swap(order_[i], order_[bounded(eng, i + 1)]);
  }
}

std::uint64_t MaterializedPermutation::at(std::uint64_t k) const {
  if (k >= order_.size()) throw std::out_of_range("permutation index " + std::to_string(k));
  return order_[k];
}

std::unique_ptr<Permutation> make_permutation(PermutationStrategy strategy,
                                              std::uint64_t seed, std::uint64_t n,
                                              std::uint64_t materialize_below) {
  if (n == 0) throw std::invalid_argument("permutation over zero chunks");
  if (strategy == PermutationStrategy::Auto) {
    strategy = (n <= materialize_below) ? PermutationStrategy::Materialized
                                        : PermutationStrategy::Lazy;
  }
  if (strategy == PermutationStrategy::Materialized) {
    return std::make_unique<MaterializedPermutation>(seed, n);
  }
  return std::make_unique<FeistelPermutation>(seed, n);
}

std::uint64_t draw_seed() {
  std::random_device rd;
  return (static_cast<std::uint64_t>(rd()) << 32) ^ static_cast<std::uint64_t>(rd());
}

}
