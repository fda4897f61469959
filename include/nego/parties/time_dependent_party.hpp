#pragma once
#include <cstdint>
#include <optional>
#include <vector>

#include "nego/party.hpp"

namespace nego::parties {

struct TimeDependentConfig {
  double e{0.2};         // < 1 Boulware, 1 linear, > 1 conceder
  double min_utility{0.4};
};

// Classic time-dependent tactic: target(t) = 1 - (1 - min) * t^(1/e). Offers
// the bid closest above the target, accepts offers that reach it.
class TimeDependentParty final : public Party {
public:
  TimeDependentParty(SessionSettings settings, TimeDependentConfig cfg = {});

  const PartyId& id() const noexcept override { return s_.id; }
  std::string description() const override { return "Time-dependent concession (Boulware for e < 1)"; }

  void notify(const Inform& info, std::vector<Action>& out) override;

  double target(double progress) const;

private:
  SessionSettings s_;
  TimeDependentConfig cfg_{};

  std::vector<std::pair<double, Bid>> ranked_; // ascending utility
  std::optional<Bid> last_received_{};
};

} // namespace nego::parties
