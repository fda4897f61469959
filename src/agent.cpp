#include "nego/agent.hpp"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <type_traits>

namespace nego {

namespace fs = std::filesystem;

FrankenAgent::FrankenAgent(SessionSettings settings,
                           uint64_t seed,
                           std::shared_ptr<Reporter> reporter,
                           Clock clock)
  : s_(std::move(settings)),
    reporter_(reporter ? std::move(reporter) : std::make_shared<NullReporter>()),
    clock_(clock ? std::move(clock) : Clock(wall_clock_ms)),
    rng_(seed) {
  if (!s_.profile) throw std::invalid_argument("agent needs a profile");
  if (!s_.progress) throw std::invalid_argument("agent needs a progress");
  reporter_->log(LogLevel::Info, "party is initialized");
}

std::string FrankenAgent::description() const {
  return "Frequency opponent model with a random concession search and a combined next-bid/time acceptance rule";
}

void FrankenAgent::notify(const Inform& info, std::vector<Action>& out) {
  if (terminated_) {
    reporter_->log(LogLevel::Warning, "ignoring event after session finished");
    return;
  }

  std::visit([&](const auto& ev) {
    using T = std::decay_t<decltype(ev)>;
    if constexpr (std::is_same_v<T, ActionDone>) {
      on_action_done_(ev);
    } else if constexpr (std::is_same_v<T, YourTurn>) {
      on_your_turn_(out);
    } else {
      on_finished_(ev);
    }
  }, info);
}

void FrankenAgent::on_action_done_(const ActionDone& ev) {
  const Action& a = ev.action;
  if (a.actor == s_.id) return;

  other_ = party_name(a.actor);
  if (a.type != ActionType::Offer) return;

  const Domain& domain = s_.profile->domain();
  if (!domain.contains(a.bid)) {
    reporter_->log(LogLevel::Warning, "ignoring offer outside the domain from " + a.actor);
    return;
  }

  if (!opponent_model_) opponent_model_.emplace(domain);

  // model first, then the bid becomes the next baseline
  opponent_model_->update(a.bid);
  last_received_bid_ = a.bid;

  reporter_->log(LogLevel::Debug, "opponent offered " + domain.to_string(a.bid));
}

void FrankenAgent::on_your_turn_(std::vector<Action>& out) {
  const Bid bid = find_bid();
  const Domain& domain = s_.profile->domain();

  if (accept(bid, last_received_bid_)) {
    reporter_->log(LogLevel::Info, "accepting " + domain.to_string(*last_received_bid_));
    out.push_back(Action::accept(s_.id, *last_received_bid_));
    return;
  }

  reporter_->log(LogLevel::Info, "offering " + domain.to_string(bid));
  out.push_back(Action::offer(s_.id, bid));
}

void FrankenAgent::on_finished_(const Finished& ev) {
  if (ev.agreement) {
    reporter_->log(LogLevel::Info, "agreement " + s_.profile->domain().to_string(*ev.agreement));
  }
  (void)save_data();
  reporter_->log(LogLevel::Info, "party is terminating");
  terminated_ = true;
}

double FrankenAgent::progress_() const {
  return s_.progress->get(clock_());
}

Bid FrankenAgent::find_bid() {
  BidScorer scorer;
  if (s_.config.rank_candidates) {
    const double t = progress_();
    scorer = [this, t](const Bid& b) {
      return nego::score_bid(b, *s_.profile, t, opponent_model_ ? &*opponent_model_ : nullptr, s_.config.score);
    };
  }
  return nego::find_bid(s_.profile->domain(), *s_.profile, last_received_bid_, s_.config.search, rng_, scorer);
}

bool FrankenAgent::accept(const Bid& my_upcoming_bid, const std::optional<Bid>& opponent_offer) const {
  return should_accept(my_upcoming_bid, opponent_offer, *s_.profile, progress_(), s_.config.acceptance);
}

double FrankenAgent::score_bid(const Bid& bid) const {
  return nego::score_bid(bid, *s_.profile, progress_(), opponent_model_ ? &*opponent_model_ : nullptr, s_.config.score);
}

bool FrankenAgent::save_data() const {
  if (s_.storage_dir.empty()) {
    reporter_->log(LogLevel::Warning, "no storage_dir, skipping save");
    return false;
  }

  const fs::path p = fs::path(s_.storage_dir) / "data.md";
  std::ofstream f(p, std::ios::trunc);
  if (!f) {
    reporter_->log(LogLevel::Warning, "cannot open " + p.string());
    return false;
  }

  f << "Data for learning (see README.md)";
  f.flush();
  if (!f) {
    reporter_->log(LogLevel::Warning, "write failed for " + p.string());
    return false;
  }
  return true;
}

} // namespace nego
