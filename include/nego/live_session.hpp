#pragma once
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "nego/agent.hpp"
#include "nego/progress.hpp"
#include "nego/reporter.hpp"

namespace nego {

// Human-vs-agent session behind the HTTP gateway. The human moves first; the
// agent answers inside the same call. Calls are serialised by a mutex.
class LiveSession {
public:
  struct Snapshot {
    double progress{0.0};
    uint32_t turns{0};
    std::optional<Bid> human_offer{};
    std::optional<Bid> agent_offer{};
    std::optional<double> agent_utility_of_human_offer{};
    std::optional<double> agent_utility_of_agent_offer{};
    std::optional<Bid> agreement{};
    bool finished{false};
  };

  struct Reply {
    bool ok{false};
    std::string error{};
    std::optional<Action> agent_action{};
  };

  LiveSession(std::shared_ptr<const UtilitySpace> agent_profile,
              Ts duration_ms,
              uint64_t seed,
              std::string storage_dir,
              std::shared_ptr<Reporter> reporter = std::make_shared<NullReporter>(),
              Clock clock = wall_clock_ms);

  const Domain& domain() const noexcept { return profile_->domain(); }
  static const PartyId& human_id();

  Reply human_offer(const Bid& bid);
  Reply human_accept();

  Snapshot snapshot() const;

private:
  bool deadline_passed_() const;
  void finish_(std::optional<Bid> agreement);

  mutable std::mutex mu_;
  std::shared_ptr<const UtilitySpace> profile_;
  std::shared_ptr<ProgressTime> progress_;
  Clock clock_;
  std::unique_ptr<FrankenAgent> agent_;

  uint32_t turns_{0};
  std::optional<Bid> human_offer_{};
  std::optional<Bid> agent_offer_{};
  std::optional<Bid> agreement_{};
  bool finished_{false};
};

} // namespace nego
