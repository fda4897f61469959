#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>

#include "nego/agent.hpp"
#include "nego/scenario.hpp"

namespace fs = std::filesystem;

namespace {

struct AgentFixture {
  std::shared_ptr<const nego::LinearAdditiveUtilitySpace> profile =
      std::make_shared<const nego::LinearAdditiveUtilitySpace>(nego::make_party_profile(0));
  std::shared_ptr<nego::ProgressRounds> progress = std::make_shared<nego::ProgressRounds>(100);
  std::ostringstream log;

  std::unique_ptr<nego::FrankenAgent> make(std::string storage_dir = {}) {
    nego::SessionSettings s{};
    s.id = "frankenagent_1";
    s.profile = profile;
    s.progress = progress;
    s.storage_dir = std::move(storage_dir);
    return std::make_unique<nego::FrankenAgent>(
        s, 17, std::make_shared<nego::StreamReporter>(log, nego::LogLevel::Debug));
  }

  // lowest own utility on every issue
  nego::Bid worst_bid() const {
    return *profile->domain().make_bid({{"food", "finger_food"},
                                         {"drinks", "non_alcoholic"},
                                         {"location", "your_dorm"},
                                         {"invitations", "plain"},
                                         {"music", "mp3"},
                                         {"cleanup", "water_and_soap"}});
  }
};

void advance_rounds(nego::ProgressRounds& p, int n) {
  for (int i = 0; i < n; ++i) p.advance();
}

} // namespace

TEST(FrankenAgent, DeclaresSaopCapabilities) {
  AgentFixture fx;
  auto agent = fx.make();
  const auto caps = agent->capabilities();
  EXPECT_EQ(caps.protocols.count("SAOP"), 1u);
  EXPECT_EQ(caps.profiles.count("LinearAdditive"), 1u);
  EXPECT_FALSE(agent->description().empty());
  EXPECT_NE(fx.log.str().find("party is initialized"), std::string::npos);
}

TEST(FrankenAgent, OpensWithAnOfferAndNoModel) {
  AgentFixture fx;
  auto agent = fx.make();

  std::vector<nego::Action> out;
  agent->notify(nego::YourTurn{}, out);

  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].type, nego::ActionType::Offer);
  EXPECT_EQ(out[0].actor, "frankenagent_1");
  EXPECT_TRUE(fx.profile->domain().contains(out[0].bid));
  EXPECT_FALSE(agent->opponent_model().has_value());
  EXPECT_FALSE(agent->last_received_bid().has_value());
}

TEST(FrankenAgent, IgnoresItsOwnActions) {
  AgentFixture fx;
  auto agent = fx.make();

  std::vector<nego::Action> out;
  agent->notify(nego::ActionDone{nego::Action::offer("frankenagent_1", fx.worst_bid())}, out);

  EXPECT_TRUE(out.empty());
  EXPECT_FALSE(agent->opponent_model().has_value());
  EXPECT_FALSE(agent->last_received_bid().has_value());
}

TEST(FrankenAgent, ModelCreatedOnFirstOpponentOfferAndKept) {
  AgentFixture fx;
  auto agent = fx.make();
  const auto& d = fx.profile->domain();

  std::vector<nego::Action> out;
  agent->notify(nego::ActionDone{nego::Action::offer("boulware_2", d.get(5))}, out);

  ASSERT_TRUE(agent->opponent_model().has_value());
  const auto* first = &*agent->opponent_model();
  EXPECT_EQ(agent->opponent_model()->observations(), 1u);
  EXPECT_EQ(*agent->last_received_bid(), d.get(5));
  EXPECT_EQ(agent->opponent_name(), "boulware");

  agent->notify(nego::ActionDone{nego::Action::offer("boulware_2", d.get(9))}, out);
  agent->notify(nego::ActionDone{nego::Action::offer("boulware_2", d.get(9))}, out);

  EXPECT_EQ(&*agent->opponent_model(), first);
  EXPECT_EQ(agent->opponent_model()->observations(), 3u);
  EXPECT_EQ(*agent->last_received_bid(), d.get(9));
  EXPECT_TRUE(out.empty());
}

TEST(FrankenAgent, OpponentAcceptDoesNotTouchModel) {
  AgentFixture fx;
  auto agent = fx.make();

  std::vector<nego::Action> out;
  agent->notify(nego::ActionDone{nego::Action::accept("boulware_2", fx.worst_bid())}, out);
  EXPECT_FALSE(agent->opponent_model().has_value());
  EXPECT_EQ(agent->opponent_name(), "boulware");
}

TEST(FrankenAgent, CountersAWorseOfferBeforeDeadline) {
  AgentFixture fx;
  auto agent = fx.make();
  advance_rounds(*fx.progress, 50);

  std::vector<nego::Action> out;
  agent->notify(nego::ActionDone{nego::Action::offer("boulware_2", fx.worst_bid())}, out);

  for (int turn = 0; turn < 20; ++turn) {
    out.clear();
    agent->notify(nego::YourTurn{}, out);
    ASSERT_EQ(out.size(), 1u);
    EXPECT_EQ(out[0].type, nego::ActionType::Offer);
  }
}

TEST(FrankenAgent, AcceptsLastOfferPastTimeThreshold) {
  AgentFixture fx;
  auto agent = fx.make();
  advance_rounds(*fx.progress, 96);

  std::vector<nego::Action> out;
  agent->notify(nego::ActionDone{nego::Action::offer("boulware_2", fx.worst_bid())}, out);
  agent->notify(nego::YourTurn{}, out);

  ASSERT_EQ(out.size(), 1u);
  EXPECT_EQ(out[0].type, nego::ActionType::Accept);
  EXPECT_EQ(out[0].bid, fx.worst_bid());
}

TEST(FrankenAgent, AcceptsOfferBetterThanAnythingItWouldPropose) {
  AgentFixture fx;
  nego::SessionSettings s{};
  s.id = "frankenagent_1";
  s.profile = fx.profile;
  s.progress = fx.progress;
  // a margin of zero against the best bid leaves only the whole-space fallback
  s.config.search.concession_margin = 0.0;
  nego::FrankenAgent agent(s, 3);

  const nego::Bid best = fx.profile->best_bid();
  std::vector<nego::Action> out;
  agent.notify(nego::ActionDone{nego::Action::offer("boulware_2", best)}, out);
  agent.notify(nego::YourTurn{}, out);

  ASSERT_EQ(out.size(), 1u);
  // an accept carries the offer; a counter-offer is only possible when the
  // fallback drew the best bid itself
  EXPECT_EQ(out[0].bid, best);
}

TEST(FrankenAgent, RankedSearchUsesScore) {
  AgentFixture fx;
  nego::SessionSettings s{};
  s.id = "frankenagent_1";
  s.profile = fx.profile;
  s.progress = fx.progress;
  s.config.rank_candidates = true;
  s.config.search.max_bids_to_check = fx.profile->domain().size();
  nego::FrankenAgent agent(s, 3);

  // early on the score is dominated by own utility: full scan finds the best bid
  EXPECT_EQ(agent.find_bid(), fx.profile->best_bid());
  EXPECT_GT(agent.score_bid(fx.profile->best_bid()), agent.score_bid(fx.worst_bid()));
}

TEST(FrankenAgent, NoActionsAfterFinished) {
  AgentFixture fx;
  auto agent = fx.make();

  std::vector<nego::Action> out;
  agent->notify(nego::Finished{}, out);
  EXPECT_TRUE(agent->terminated());

  agent->notify(nego::YourTurn{}, out);
  agent->notify(nego::ActionDone{nego::Action::offer("boulware_2", fx.worst_bid())}, out);
  EXPECT_TRUE(out.empty());
  EXPECT_FALSE(agent->opponent_model().has_value());
  EXPECT_NE(fx.log.str().find("party is terminating"), std::string::npos);
}

TEST(FrankenAgent, SavesPlaceholderOnFinish) {
  const fs::path dir = fs::temp_directory_path() / "nego_agent_save_test";
  fs::remove_all(dir);
  fs::create_directories(dir);

  AgentFixture fx;
  auto agent = fx.make(dir.string());
  std::vector<nego::Action> out;
  agent->notify(nego::Finished{}, out);

  std::ifstream f(dir / "data.md");
  ASSERT_TRUE(f.good());
  std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  EXPECT_EQ(content, "Data for learning (see README.md)");

  fs::remove_all(dir);
}

TEST(FrankenAgent, SaveFailureIsReportedNotThrown) {
  AgentFixture fx;
  auto missing = fx.make((fs::temp_directory_path() / "nego_no_such_dir" / "deeper").string());
  EXPECT_FALSE(missing->save_data());

  auto unset = fx.make();
  EXPECT_FALSE(unset->save_data());

  std::vector<nego::Action> out;
  EXPECT_NO_THROW(missing->notify(nego::Finished{}, out));
  EXPECT_NE(fx.log.str().find("[WARN]"), std::string::npos);
}
