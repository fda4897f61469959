#include "nego/bid_search.hpp"

#include <algorithm>

namespace nego {

std::vector<Bid> filter_candidates(const std::vector<Bid>& sample,
                                   const UtilitySpace& us,
                                   double threshold) {
  std::vector<Bid> out;
  out.reserve(sample.size());
  for (const auto& b : sample) {
    if (us.utility(b) > threshold) out.push_back(b);
  }
  return out;
}

static std::vector<Bid> draw_sample(const Domain& domain, uint64_t k, Rng& rng) {
  std::vector<Bid> bids;
  const auto idx = rng.sample_distinct(domain.size(), k);
  bids.reserve(idx.size());
  for (uint64_t i : idx) bids.push_back(domain.get(i));
  return bids;
}

static const Bid& pick(const std::vector<Bid>& candidates, Rng& rng, const BidScorer& scorer) {
  if (!scorer) return rng.choice(candidates);

  std::size_t best = 0;
  double best_score = scorer(candidates[0]);
  for (std::size_t i = 1; i < candidates.size(); ++i) {
    const double s = scorer(candidates[i]);
    if (s > best_score) {
      best_score = s;
      best = i;
    }
  }
  return candidates[best];
}

Bid find_bid(const Domain& domain,
             const UtilitySpace& us,
             const std::optional<Bid>& last_received,
             const BidSearchParams& p,
             Rng& rng,
             const BidScorer& scorer) {
  const uint64_t k = std::max<uint64_t>(1, p.max_bids_to_check);
  const auto sample = draw_sample(domain, k, rng);

  if (!last_received) return pick(sample, rng, scorer);

  const double previous_offer_utility = us.utility(*last_received);
  const auto candidates = filter_candidates(sample, us, concession_threshold(previous_offer_utility, p));

  if (candidates.empty()) return domain.get(rng.uniform_index(domain.size()));
  return pick(candidates, rng, scorer);
}

} // namespace nego
