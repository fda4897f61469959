#pragma once
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "nego/acceptance.hpp"
#include "nego/bid_search.hpp"
#include "nego/events.hpp"
#include "nego/progress.hpp"
#include "nego/scoring.hpp"
#include "nego/utility_space.hpp"

namespace nego {

struct Capabilities {
  std::set<std::string> protocols{"SAOP"};
  std::set<std::string> profiles{"LinearAdditive"};
};

struct AgentConfig {
  BidSearchParams search{};
  AcceptanceParams acceptance{};
  ScoreParams score{};

  // Rank filtered candidates with score_bid instead of picking at random.
  bool rank_candidates{false};
};

// What the environment hands a party when the session starts.
struct SessionSettings {
  PartyId id{};
  std::shared_ptr<const UtilitySpace> profile{};
  std::shared_ptr<const Progress> progress{};
  std::string storage_dir{};
  AgentConfig config{};
};

class Party {
public:
  virtual ~Party() = default;

  virtual const PartyId& id() const noexcept = 0;
  virtual Capabilities capabilities() const { return Capabilities{}; }
  virtual std::string description() const = 0;

  // Handle one protocol event; any reply goes to out.
  virtual void notify(const Inform& info, std::vector<Action>& out) = 0;
};

} // namespace nego
