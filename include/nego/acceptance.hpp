#pragma once
#include <optional>

#include "nego/domain.hpp"
#include "nego/utility_space.hpp"

namespace nego {

struct AcceptanceParams {
  double time_threshold{0.95};
};

// Accept when the opponent's last offer already beats the bid we are about to
// make, or when progress is past the time threshold. Never accepts without an
// opponent offer.
bool should_accept(const Bid& my_upcoming_bid,
                   const std::optional<Bid>& opponent_bid,
                   const UtilitySpace& us,
                   double progress,
                   const AcceptanceParams& p = {});

} // namespace nego
