#pragma once
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "nego/opponent_model.hpp"
#include "nego/party.hpp"
#include "nego/reporter.hpp"
#include "nego/rng.hpp"

namespace nego {

using Clock = std::function<Ts()>;

// Frequency-modelling agent: random concession search, AC_next or AC_time
// acceptance, opponent model built from the opponent's offers.
class FrankenAgent final : public Party {
public:
  FrankenAgent(SessionSettings settings,
               uint64_t seed,
               std::shared_ptr<Reporter> reporter = std::make_shared<NullReporter>(),
               Clock clock = wall_clock_ms);

  const PartyId& id() const noexcept override { return s_.id; }
  std::string description() const override;

  void notify(const Inform& info, std::vector<Action>& out) override;

  // Placeholder note to <storage_dir>/data.md; false (and a warning) on failure.
  bool save_data() const;

  const std::optional<Bid>& last_received_bid() const noexcept { return last_received_bid_; }
  const std::optional<FrequencyOpponentModel>& opponent_model() const noexcept { return opponent_model_; }
  const std::string& opponent_name() const noexcept { return other_; }
  bool terminated() const noexcept { return terminated_; }

  // Decision steps, exposed for the driver and tests.
  Bid find_bid();
  bool accept(const Bid& my_upcoming_bid, const std::optional<Bid>& opponent_offer) const;
  double score_bid(const Bid& bid) const;

private:
  void on_action_done_(const ActionDone& ev);
  void on_your_turn_(std::vector<Action>& out);
  void on_finished_(const Finished& ev);

  double progress_() const;

  SessionSettings s_;
  std::shared_ptr<Reporter> reporter_;
  Clock clock_;
  Rng rng_;

  std::optional<Bid> last_received_bid_{};
  std::optional<FrequencyOpponentModel> opponent_model_{};
  std::string other_{};
  bool terminated_{false};
};

} // namespace nego
