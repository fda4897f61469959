#include "nego/progress.hpp"

#include <algorithm>
#include <stdexcept>

namespace nego {

ProgressTime::ProgressTime(Ts duration_ms, Ts start_ms)
  : duration_ms_(duration_ms), start_ms_(start_ms) {
  if (duration_ms_ <= 0) throw std::invalid_argument("progress duration must be positive");
}

double ProgressTime::get(Ts now_ms) const {
  const double f = static_cast<double>(now_ms - start_ms_) / static_cast<double>(duration_ms_);
  return std::clamp(f, 0.0, 1.0);
}

ProgressRounds::ProgressRounds(uint32_t total_rounds, uint32_t current_round)
  : total_(total_rounds), current_(current_round) {
  if (total_ == 0) throw std::invalid_argument("progress needs at least one round");
  current_ = std::min(current_, total_);
}

double ProgressRounds::get(Ts now_ms) const {
  (void)now_ms;
  return static_cast<double>(current_) / static_cast<double>(total_);
}

void ProgressRounds::advance() noexcept {
  if (current_ < total_) ++current_;
}

} // namespace nego
