#include "nego/utility_space.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace nego {

static bool in_unit(double x) noexcept { return x >= 0.0 && x <= 1.0; }

LinearAdditiveUtilitySpace::LinearAdditiveUtilitySpace(Domain domain,
                                                       std::vector<double> weights,
                                                       std::vector<std::vector<double>> value_utils)
  : domain_(std::move(domain)), weights_(std::move(weights)), value_utils_(std::move(value_utils)) {
  const std::size_t n = domain_.issue_count();
  if (weights_.size() != n || value_utils_.size() != n) {
    throw std::invalid_argument("utility space shape does not match domain '" + domain_.name() + "'");
  }

  double sum = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    if (!in_unit(weights_[i])) throw std::invalid_argument("issue weight outside [0,1]");
    sum += weights_[i];

    if (value_utils_[i].size() != domain_.value_count(i)) {
      throw std::invalid_argument("value utilities do not match issue '" + domain_.issues()[i].name + "'");
    }
    for (double u : value_utils_[i]) {
      if (!in_unit(u)) throw std::invalid_argument("value utility outside [0,1]");
    }
  }

  if (std::abs(sum - 1.0) > 1e-6) throw std::invalid_argument("issue weights do not sum to 1");
}

double LinearAdditiveUtilitySpace::utility(const Bid& bid) const {
  double u = 0.0;
  for (std::size_t i = 0; i < weights_.size(); ++i) {
    u += weights_[i] * value_utils_[i][bid[i]];
  }
  // rounding can push a perfect bid a hair above 1
  return std::min(1.0, std::max(0.0, u));
}

Bid LinearAdditiveUtilitySpace::best_bid() const {
  Bid b;
  b.values.reserve(value_utils_.size());
  for (const auto& vals : value_utils_) {
    ValueIndex best = 0;
    for (std::size_t v = 1; v < vals.size(); ++v) {
      if (vals[v] > vals[best]) best = static_cast<ValueIndex>(v);
    }
    b.values.push_back(best);
  }
  return b;
}

} // namespace nego
