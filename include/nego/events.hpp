#pragma once
#include <cstdint>
#include <optional>
#include <variant>

#include "nego/domain.hpp"
#include "nego/types.hpp"

namespace nego {

enum class ActionType : uint8_t { Offer = 0, Accept = 1 };

struct Action {
  ActionType type{ActionType::Offer};
  PartyId actor{};
  Bid bid{}; // offered bid, or the bid being accepted

  static Action offer(const PartyId& actor, const Bid& b) {
    Action a{};
    a.type = ActionType::Offer;
    a.actor = actor;
    a.bid = b;
    return a;
  }
  static Action accept(const PartyId& actor, const Bid& b) {
    Action a{};
    a.type = ActionType::Accept;
    a.actor = actor;
    a.bid = b;
    return a;
  }
};

// An action performed by some party, ours included.
struct ActionDone {
  Action action{};
};

// The receiving party must answer with exactly one action.
struct YourTurn {};

// Session over, by agreement or deadline. No more actions are expected.
struct Finished {
  std::optional<Bid> agreement{};
};

using Inform = std::variant<ActionDone, YourTurn, Finished>;

} // namespace nego
