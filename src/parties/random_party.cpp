#include "nego/parties/random_party.hpp"

#include <type_traits>

namespace nego::parties {

RandomParty::RandomParty(SessionSettings settings, uint64_t seed, RandomPartyConfig cfg)
  : s_(std::move(settings)), cfg_(cfg), rng_(seed) {}

Bid RandomParty::next_bid_() {
  const Domain& d = s_.profile->domain();
  Bid best = d.get(rng_.uniform_index(d.size()));
  double best_u = s_.profile->utility(best);

  // best of the attempts when nothing clears the reservation value
  for (uint32_t i = 1; i < cfg_.max_attempts && best_u < cfg_.reservation; ++i) {
    Bid b = d.get(rng_.uniform_index(d.size()));
    const double u = s_.profile->utility(b);
    if (u > best_u) {
      best_u = u;
      best = std::move(b);
    }
  }
  return best;
}

void RandomParty::notify(const Inform& info, std::vector<Action>& out) {
  std::visit([&](const auto& ev) {
    using T = std::decay_t<decltype(ev)>;
    if constexpr (std::is_same_v<T, ActionDone>) {
      if (ev.action.actor != s_.id && ev.action.type == ActionType::Offer) {
        last_received_ = ev.action.bid;
      }
    } else if constexpr (std::is_same_v<T, YourTurn>) {
      if (last_received_ && s_.profile->utility(*last_received_) >= cfg_.reservation) {
        out.push_back(Action::accept(s_.id, *last_received_));
      } else {
        out.push_back(Action::offer(s_.id, next_bid_()));
      }
    }
  }, info);
}

} // namespace nego::parties
