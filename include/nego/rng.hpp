#pragma once
#include <algorithm>
#include <cstdint>
#include <numeric>
#include <random>
#include <unordered_set>
#include <vector>

namespace nego {

// Seed derivation for the parties of one session.
inline uint64_t splitmix64(uint64_t& x) noexcept {
  uint64_t z = (x += 0x9e3779b97f4a7c15ull);
  z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ull;
  z = (z ^ (z >> 27)) * 0x94d049bb133111ebull;
  return z ^ (z >> 31);
}

// Simple reproducible RNG wrapper (Mersenne Twister 64)
class Rng {
public:
  explicit Rng(uint64_t seed) : eng_(seed) {}

  // Uniform [0,1)
  double uniform01() { return uni_(eng_); }

  // Uniform integer in [0, n), n >= 1
  uint64_t uniform_index(uint64_t n) {
    std::uniform_int_distribution<uint64_t> d(0, n - 1);
    return d(eng_);
  }

  // min(n, k) distinct indices from [0, n), without replacement, in draw order.
  std::vector<uint64_t> sample_distinct(uint64_t n, uint64_t k) {
    std::vector<uint64_t> out;
    if (n == 0 || k == 0) return out;

    if (k >= n) {
      out.resize(static_cast<std::size_t>(n));
      std::iota(out.begin(), out.end(), uint64_t{0});
      std::shuffle(out.begin(), out.end(), eng_);
      return out;
    }

    // Floyd's algorithm: k draws, never touches the rest of the range
    out.reserve(static_cast<std::size_t>(k));
    std::unordered_set<uint64_t> taken;
    taken.reserve(static_cast<std::size_t>(k) * 2);
    for (uint64_t j = n - k; j < n; ++j) {
      const uint64_t t = std::uniform_int_distribution<uint64_t>(0, j)(eng_);
      const uint64_t pick = taken.insert(t).second ? t : j;
      if (pick == j) taken.insert(j);
      out.push_back(pick);
    }
    return out;
  }

  // Uniform element of a non-empty vector
  template <class T>
  const T& choice(const std::vector<T>& xs) {
    return xs[static_cast<std::size_t>(uniform_index(xs.size()))];
  }

  std::mt19937_64& engine() noexcept { return eng_; }

private:
  std::mt19937_64 eng_;
  std::uniform_real_distribution<double> uni_{0.0, 1.0};
};

} // namespace nego
