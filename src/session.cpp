#include "nego/session.hpp"

#include <stdexcept>

namespace nego {

const char* to_string(ProtocolError e) noexcept {
  switch (e) {
    case ProtocolError::None: return "None";
    case ProtocolError::NoAction: return "NoAction";
    case ProtocolError::TooManyActions: return "TooManyActions";
    case ProtocolError::WrongActor: return "WrongActor";
    case ProtocolError::BidNotInDomain: return "BidNotInDomain";
    case ProtocolError::AcceptWithoutOffer: return "AcceptWithoutOffer";
    case ProtocolError::AcceptMismatch: return "AcceptMismatch";
  }
  return "Unknown";
}

SaopSession::SaopSession(Domain domain, std::shared_ptr<ProgressRounds> progress)
  : domain_(std::move(domain)), progress_(std::move(progress)) {
  if (!progress_) throw std::invalid_argument("session needs a progress");
}

void SaopSession::add_party(std::unique_ptr<Party> p) {
  if (parties_.size() >= 2) throw std::invalid_argument("SAOP session is bilateral");
  parties_.push_back(std::move(p));
}

ProtocolError SaopSession::validate_(const Party& p,
                                     const std::vector<Action>& acts,
                                     const std::optional<Bid>& on_table) const {
  if (acts.empty()) return ProtocolError::NoAction;
  if (acts.size() > 1) return ProtocolError::TooManyActions;

  const Action& a = acts.front();
  if (a.actor != p.id()) return ProtocolError::WrongActor;
  if (!domain_.contains(a.bid)) return ProtocolError::BidNotInDomain;

  if (a.type == ActionType::Accept) {
    if (!on_table) return ProtocolError::AcceptWithoutOffer;
    if (a.bid != *on_table) return ProtocolError::AcceptMismatch;
  }
  return ProtocolError::None;
}

void SaopSession::broadcast_(const Inform& info) {
  // replies to informs other than YourTurn are dropped
  std::vector<Action> sink;
  for (auto& p : parties_) {
    p->notify(info, sink);
    sink.clear();
  }
}

SessionResult SaopSession::run() {
  if (parties_.size() != 2) throw std::invalid_argument("SAOP session needs two parties");

  SessionResult out{};
  std::optional<Bid> on_table;
  std::vector<Action> acts;

  while (!out.agreement && out.error == ProtocolError::None &&
         progress_->current_round() < progress_->total_rounds()) {
    for (auto& p : parties_) {
      acts.clear();
      p->notify(YourTurn{}, acts);

      const ProtocolError err = validate_(*p, acts, on_table);
      if (err != ProtocolError::None) {
        out.error = err;
        out.offender = p->id();
        break;
      }

      const Action a = acts.front();
      out.actions.push_back(a);
      broadcast_(ActionDone{a});

      if (a.type == ActionType::Accept) {
        out.agreement = a.bid;
        break;
      }
      on_table = a.bid;
    }

    progress_->advance();
    ++out.rounds_played;
  }

  broadcast_(Finished{out.agreement});
  return out;
}

} // namespace nego
