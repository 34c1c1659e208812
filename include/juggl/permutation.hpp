#pragma once
#include <array>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace juggl {

enum class PermutationStrategy { Lazy, Materialized, Auto };

const char* to_string(PermutationStrategy s) noexcept;
bool parse_strategy(std::string_view s, PermutationStrategy* out) noexcept;

// SplitMix64 step; also the round function of the Feistel network.
inline std::uint64_t splitmix64(std::uint64_t& state) noexcept {
  std::uint64_t z = (state += 0x9e3779b97f4a7c15ULL);
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
  return z ^ (z >> 31);
}

inline std::uint64_t mix64(std::uint64_t key, std::uint64_t data) noexcept {
  std::uint64_t s = key ^ data;
  return splitmix64(s);
}

// A bijection on [0, size()) fixed by a seed. at(k) is the source index
// for output position k.
class Permutation {
public:
  virtual ~Permutation() = default;

  virtual std::uint64_t size() const noexcept = 0;
  virtual std::uint64_t at(std::uint64_t k) const = 0;
  virtual PermutationStrategy strategy() const noexcept = 0;

  std::uint64_t operator()(std::uint64_t k) const { return at(k); }
};

// Keyed balanced Feistel network over the smallest even-width power of two
// covering n, restricted to [0, n) by cycle walking. O(1) memory.
class FeistelPermutation final : public Permutation {
public:
  static constexpr int kRounds = 6;

  FeistelPermutation(std::uint64_t seed, std::uint64_t n);

  std::uint64_t size() const noexcept override { return n_; }
  std::uint64_t at(std::uint64_t k) const override;
  PermutationStrategy strategy() const noexcept override { return PermutationStrategy::Lazy; }

  std::uint64_t inverse(std::uint64_t v) const;

private:
  std::uint64_t encrypt(std::uint64_t x) const noexcept;
  std::uint64_t decrypt(std::uint64_t x) const noexcept;

  std::uint64_t n_;
  unsigned half_bits_;
  std::uint64_t half_mask_;
  std::array<std::uint64_t, kRounds> keys_{};
};

// Identity sequence shuffled with Fisher-Yates. O(n) memory.
class MaterializedPermutation final : public Permutation {
public:
  MaterializedPermutation(std::uint64_t seed, std::uint64_t n);

  std::uint64_t size() const noexcept override { return order_.size(); }
  std::uint64_t at(std::uint64_t k) const override;
  PermutationStrategy strategy() const noexcept override { return PermutationStrategy::Materialized; }

private:
  std::vector<std::uint64_t> order_;
};

// Throws std::invalid_argument when n == 0.
// Auto materializes when n <= materialize_below, else goes lazy.
std::unique_ptr<Permutation> make_permutation(PermutationStrategy strategy,
                                              std::uint64_t seed, std::uint64_t n,
                                              std::uint64_t materialize_below = 1u << 16);

// Fresh seed from std::random_device; called once per unseeded run.
std::uint64_t draw_seed();

}
