#include "nego/opponent_model.hpp"

namespace nego {

FrequencyOpponentModel::FrequencyOpponentModel(const Domain& domain)
  : totals_(domain.issue_count(), 0) {
  counts_.reserve(domain.issue_count());
  for (std::size_t i = 0; i < domain.issue_count(); ++i) {
    counts_.emplace_back(domain.value_count(i), 0);
  }
}

void FrequencyOpponentModel::update(const Bid& bid) {
  for (std::size_t i = 0; i < counts_.size(); ++i) {
    ++counts_[i][bid[i]];
    ++totals_[i];
  }
  ++observations_;
}

double FrequencyOpponentModel::predicted_utility(const Bid& bid) const {
  if (counts_.empty()) return 0.0;

  double sum = 0.0;
  for (std::size_t i = 0; i < counts_.size(); ++i) {
    if (totals_[i] == 0) {
      sum += 1.0 / static_cast<double>(counts_[i].size());
    } else {
      sum += static_cast<double>(counts_[i][bid[i]]) / static_cast<double>(totals_[i]);
    }
  }
  return sum / static_cast<double>(counts_.size());
}

} // namespace nego
