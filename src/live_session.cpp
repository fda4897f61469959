#include "nego/live_session.hpp"

#include <vector>

namespace nego {

const PartyId& LiveSession::human_id() {
  static const PartyId id{"human_2"};
  return id;
}

LiveSession::LiveSession(std::shared_ptr<const UtilitySpace> agent_profile,
                         Ts duration_ms,
                         uint64_t seed,
                         std::string storage_dir,
                         std::shared_ptr<Reporter> reporter,
                         Clock clock)
  : profile_(std::move(agent_profile)),
    clock_(clock ? std::move(clock) : Clock(wall_clock_ms)) {
  progress_ = std::make_shared<ProgressTime>(duration_ms, clock_());

  SessionSettings s{};
  s.id = "frankenagent_1";
  s.profile = profile_;
  s.progress = progress_;
  s.storage_dir = std::move(storage_dir);

  agent_ = std::make_unique<FrankenAgent>(std::move(s), seed, std::move(reporter), clock_);
}

bool LiveSession::deadline_passed_() const {
  return progress_->is_past_deadline(clock_());
}

void LiveSession::finish_(std::optional<Bid> agreement) {
  std::vector<Action> sink;
  agent_->notify(Finished{agreement}, sink);
  agreement_ = std::move(agreement);
  finished_ = true;
}

LiveSession::Reply LiveSession::human_offer(const Bid& bid) {
  std::lock_guard<std::mutex> lk(mu_);
  Reply r{};

  if (finished_) { r.error = "session finished"; return r; }
  if (deadline_passed_()) {
    finish_(std::nullopt);
    r.error = "deadline passed";
    return r;
  }
  if (!domain().contains(bid)) { r.error = "bid not in domain"; return r; }

  std::vector<Action> acts;
  const Action offer = Action::offer(human_id(), bid);
  agent_->notify(ActionDone{offer}, acts);
  human_offer_ = bid;
  ++turns_;

  acts.clear();
  agent_->notify(YourTurn{}, acts);
  if (acts.size() != 1) { r.error = "agent did not act"; return r; }

  const Action reply = acts.front();
  std::vector<Action> sink;
  agent_->notify(ActionDone{reply}, sink);
  ++turns_;

  if (reply.type == ActionType::Accept) {
    finish_(reply.bid);
  } else {
    agent_offer_ = reply.bid;
  }

  r.ok = true;
  r.agent_action = reply;
  return r;
}

LiveSession::Reply LiveSession::human_accept() {
  std::lock_guard<std::mutex> lk(mu_);
  Reply r{};

  if (finished_) { r.error = "session finished"; return r; }
  if (!agent_offer_) { r.error = "nothing to accept"; return r; }
  if (deadline_passed_()) {
    finish_(std::nullopt);
    r.error = "deadline passed";
    return r;
  }

  std::vector<Action> sink;
  agent_->notify(ActionDone{Action::accept(human_id(), *agent_offer_)}, sink);
  ++turns_;
  finish_(*agent_offer_);

  r.ok = true;
  return r;
}

LiveSession::Snapshot LiveSession::snapshot() const {
  std::lock_guard<std::mutex> lk(mu_);

  Snapshot s{};
  s.progress = progress_->get(clock_());
  s.turns = turns_;
  s.human_offer = human_offer_;
  s.agent_offer = agent_offer_;
  if (human_offer_) s.agent_utility_of_human_offer = profile_->utility(*human_offer_);
  if (agent_offer_) s.agent_utility_of_agent_offer = profile_->utility(*agent_offer_);
  s.agreement = agreement_;
  s.finished = finished_;
  return s;
}

} // namespace nego
