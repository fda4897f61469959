#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

#include "nego/domain.hpp"
#include "nego/rng.hpp"
#include "nego/utility_space.hpp"

namespace nego {

struct BidSearchParams {
  uint64_t max_bids_to_check{500};
  double concession_margin{0.9}; // on the [0,1] utility scale
};

// Optional ranking of filtered candidates (higher is better).
using BidScorer = std::function<double(const Bid&)>;

inline double concession_threshold(double previous_offer_utility, const BidSearchParams& p) noexcept {
  return previous_offer_utility - p.concession_margin;
}

// Bids whose own utility is strictly above the threshold, in input order.
std::vector<Bid> filter_candidates(const std::vector<Bid>& sample,
                                   const UtilitySpace& us,
                                   double threshold);

// Next bid to offer. Samples up to max_bids_to_check distinct bids, keeps the
// ones within the concession margin of the opponent's last offer and picks one
// at random (or the best scored one when a scorer is given). Without a last
// offer the sample is not filtered. Falls back to a random bid from the whole
// space when nothing survives the filter.
Bid find_bid(const Domain& domain,
             const UtilitySpace& us,
             const std::optional<Bid>& last_received,
             const BidSearchParams& p,
             Rng& rng,
             const BidScorer& scorer = {});

} // namespace nego
