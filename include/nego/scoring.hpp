#pragma once
#include "nego/domain.hpp"
#include "nego/opponent_model.hpp"
#include "nego/utility_space.hpp"

namespace nego {

struct ScoreParams {
  double alpha{0.95}; // self-interest weight
  double eps{0.1};    // time pressure shape; smaller concedes later and harder
};

// 1 - progress^(1/eps): stays near 1 for most of the session, drops near the end.
double time_pressure(double progress, double eps);

// alpha * tp * u(bid), plus (1 - alpha * tp) * predicted opponent utility when
// an opponent model is available.
double score_bid(const Bid& bid,
                 const UtilitySpace& us,
                 double progress,
                 const FrequencyOpponentModel* opponent,
                 const ScoreParams& p = {});

} // namespace nego
