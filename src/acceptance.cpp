#include "nego/acceptance.hpp"

namespace nego {

bool should_accept(const Bid& my_upcoming_bid,
                   const std::optional<Bid>& opponent_bid,
                   const UtilitySpace& us,
                   double progress,
                   const AcceptanceParams& p) {
  if (!opponent_bid) return false;

  const bool next_beaten = us.utility(*opponent_bid) > us.utility(my_upcoming_bid);
  const bool time_up = progress > p.time_threshold;
  return next_beaten || time_up;
}

} // namespace nego
