#include "nego/scoring.hpp"

#include <cmath>

namespace nego {

double time_pressure(double progress, double eps) {
  return 1.0 - std::pow(progress, 1.0 / eps);
}

double score_bid(const Bid& bid,
                 const UtilitySpace& us,
                 double progress,
                 const FrequencyOpponentModel* opponent,
                 const ScoreParams& p) {
  const double tp = time_pressure(progress, p.eps);
  double score = p.alpha * tp * us.utility(bid);

  if (opponent) {
    score += (1.0 - p.alpha * tp) * opponent->predicted_utility(bid);
  }
  return score;
}

} // namespace nego
