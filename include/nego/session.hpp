#pragma once
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "nego/domain.hpp"
#include "nego/events.hpp"
#include "nego/party.hpp"
#include "nego/progress.hpp"

namespace nego {

enum class ProtocolError : uint8_t {
  None = 0,
  NoAction,
  TooManyActions,
  WrongActor,
  BidNotInDomain,
  AcceptWithoutOffer,
  AcceptMismatch
};

const char* to_string(ProtocolError e) noexcept;

struct SessionConfig {
  uint32_t rounds{200}; // one turn per party per round
};

struct SessionResult {
  std::optional<Bid> agreement{};
  uint32_t rounds_played{0};
  std::vector<Action> actions;

  ProtocolError error{ProtocolError::None};
  PartyId offender{};
};

// Two-party stacked alternating offers. The first party added opens.
class SaopSession {
public:
  SaopSession(Domain domain, std::shared_ptr<ProgressRounds> progress);

  void add_party(std::unique_ptr<Party> p);
  Party& party(std::size_t i) { return *parties_.at(i); }

  // Runs to agreement, deadline or protocol error. Needs exactly two parties.
  SessionResult run();

private:
  ProtocolError validate_(const Party& p,
                          const std::vector<Action>& acts,
                          const std::optional<Bid>& on_table) const;
  void broadcast_(const Inform& info);

  Domain domain_;
  std::shared_ptr<ProgressRounds> progress_;
  std::vector<std::unique_ptr<Party>> parties_;
};

} // namespace nego
