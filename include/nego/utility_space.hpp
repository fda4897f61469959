#pragma once
#include <vector>

#include "nego/domain.hpp"

namespace nego {

// Own preferences over a domain. utility() is pure and returns a value in [0,1].
class UtilitySpace {
public:
  virtual ~UtilitySpace() = default;
  virtual const Domain& domain() const noexcept = 0;
  virtual double utility(const Bid& bid) const = 0;
};

class LinearAdditiveUtilitySpace final : public UtilitySpace {
public:
  // weights[i] is the weight of issue i, value_utils[i][v] the utility of value v.
  LinearAdditiveUtilitySpace(Domain domain,
                             std::vector<double> weights,
                             std::vector<std::vector<double>> value_utils);

  const Domain& domain() const noexcept override { return domain_; }
  double utility(const Bid& bid) const override;

  double weight(std::size_t issue) const noexcept { return weights_[issue]; }

  // Highest-utility bid: best value on every issue.
  Bid best_bid() const;

private:
  Domain domain_;
  std::vector<double> weights_;
  std::vector<std::vector<double>> value_utils_;
};

} // namespace nego
