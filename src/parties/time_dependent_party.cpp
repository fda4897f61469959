#include "nego/parties/time_dependent_party.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <type_traits>

namespace nego::parties {

// Enough to rank a small domain exhaustively; larger ones use a stride.
static constexpr uint64_t kMaxRanked = 20'000;

TimeDependentParty::TimeDependentParty(SessionSettings settings, TimeDependentConfig cfg)
  : s_(std::move(settings)), cfg_(cfg) {
  const Domain& d = s_.profile->domain();
  const uint64_t n = d.size();
  const uint64_t stride = std::max<uint64_t>(1, n / kMaxRanked);

  for (uint64_t i = 0; i < n; i += stride) {
    Bid b = d.get(i);
    ranked_.emplace_back(s_.profile->utility(b), std::move(b));
  }
  std::stable_sort(ranked_.begin(), ranked_.end(),
                   [](const auto& a, const auto& b) { return a.first < b.first; });
}

double TimeDependentParty::target(double progress) const {
  return 1.0 - (1.0 - cfg_.min_utility) * std::pow(progress, 1.0 / cfg_.e);
}

void TimeDependentParty::notify(const Inform& info, std::vector<Action>& out) {
  std::visit([&](const auto& ev) {
    using T = std::decay_t<decltype(ev)>;
    if constexpr (std::is_same_v<T, ActionDone>) {
      if (ev.action.actor != s_.id && ev.action.type == ActionType::Offer) {
        last_received_ = ev.action.bid;
      }
    } else if constexpr (std::is_same_v<T, YourTurn>) {
      const double tgt = target(s_.progress->get(wall_clock_ms()));

      if (last_received_ && s_.profile->utility(*last_received_) >= tgt) {
        out.push_back(Action::accept(s_.id, *last_received_));
        return;
      }

      auto it = std::lower_bound(ranked_.begin(), ranked_.end(), tgt,
                                 [](const auto& x, double v) { return x.first < v; });
      if (it == ranked_.end()) it = std::prev(ranked_.end());
      out.push_back(Action::offer(s_.id, it->second));
    }
  }, info);
}

} // namespace nego::parties
