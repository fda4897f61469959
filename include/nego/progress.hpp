#pragma once
#include <chrono>
#include <cstdint>

#include "nego/types.hpp"

namespace nego {

// Wall clock in ms since the epoch, the time base of ProgressTime.
inline Ts wall_clock_ms() {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

// Elapsed share of the negotiation budget: 0 at start, 1 at the deadline.
class Progress {
public:
  virtual ~Progress() = default;
  virtual double get(Ts now_ms) const = 0;
  bool is_past_deadline(Ts now_ms) const { return get(now_ms) >= 1.0; }
};

class ProgressTime final : public Progress {
public:
  ProgressTime(Ts duration_ms, Ts start_ms);

  double get(Ts now_ms) const override;

  Ts duration_ms() const noexcept { return duration_ms_; }
  Ts start_ms() const noexcept { return start_ms_; }

private:
  Ts duration_ms_{0};
  Ts start_ms_{0};
};

// Round based deadline. The session runner advances it; now_ms is ignored.
class ProgressRounds final : public Progress {
public:
  explicit ProgressRounds(uint32_t total_rounds, uint32_t current_round = 0);

  double get(Ts now_ms) const override;

  void advance() noexcept;
  uint32_t current_round() const noexcept { return current_; }
  uint32_t total_rounds() const noexcept { return total_; }

private:
  uint32_t total_{1};
  uint32_t current_{0};
};

} // namespace nego
