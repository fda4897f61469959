#pragma once
#include <cstdint>
#include <vector>

#include "nego/domain.hpp"

namespace nego {

// Frequency-based estimate of the opponent's preferences: values the opponent
// offers more often are assumed to be preferred. All issues weigh the same.
class FrequencyOpponentModel {
public:
  explicit FrequencyOpponentModel(const Domain& domain);

  void update(const Bid& bid);

  // Mean over issues of count(value) / total(issue), in [0,1]. Issues with no
  // observations contribute 1 / |values|.
  double predicted_utility(const Bid& bid) const;

  uint64_t count(std::size_t issue, ValueIndex value) const noexcept { return counts_[issue][value]; }
  uint64_t total(std::size_t issue) const noexcept { return totals_[issue]; }
  uint64_t observations() const noexcept { return observations_; }

private:
  std::vector<std::vector<uint64_t>> counts_; // issue -> value -> count
  std::vector<uint64_t> totals_;              // issue -> sum of counts
  uint64_t observations_{0};
};

} // namespace nego
