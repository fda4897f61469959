#pragma once
#include <cstdint>
#include <optional>

#include "nego/party.hpp"
#include "nego/rng.hpp"

namespace nego::parties {

struct RandomPartyConfig {
  double reservation{0.6};  // minimum own utility it offers or accepts
  uint32_t max_attempts{200};
};

// Offers random bids above its reservation value, accepts any offer that
// reaches it.
class RandomParty final : public Party {
public:
  RandomParty(SessionSettings settings, uint64_t seed, RandomPartyConfig cfg = {});

  const PartyId& id() const noexcept override { return s_.id; }
  std::string description() const override { return "Random offers above a fixed reservation value"; }

  void notify(const Inform& info, std::vector<Action>& out) override;

private:
  Bid next_bid_();

  SessionSettings s_;
  RandomPartyConfig cfg_{};
  Rng rng_;
  std::optional<Bid> last_received_{};
};

} // namespace nego::parties
