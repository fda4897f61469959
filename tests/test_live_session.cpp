#include <gtest/gtest.h>

#include <memory>

#include "nego/live_session.hpp"
#include "nego/scenario.hpp"

namespace {

struct LiveFixture {
  nego::Ts now{1'000};
  std::shared_ptr<const nego::LinearAdditiveUtilitySpace> profile =
      std::make_shared<const nego::LinearAdditiveUtilitySpace>(nego::make_party_profile(0));

  std::unique_ptr<nego::LiveSession> make() {
    return std::make_unique<nego::LiveSession>(
        profile, 10'000, 5, std::string{}, std::make_shared<nego::NullReporter>(),
        [this]() { return now; });
  }

  nego::Bid worst_bid() const {
    return *profile->domain().make_bid({{"food", "finger_food"},
                                         {"drinks", "non_alcoholic"},
                                         {"location", "your_dorm"},
                                         {"invitations", "plain"},
                                         {"music", "mp3"},
                                         {"cleanup", "water_and_soap"}});
  }
};

} // namespace

TEST(LiveSession, AgentCountersThenHumanAccepts) {
  LiveFixture fx;
  auto s = fx.make();

  const auto r = s->human_offer(fx.worst_bid());
  ASSERT_TRUE(r.ok) << r.error;
  ASSERT_TRUE(r.agent_action.has_value());
  EXPECT_EQ(r.agent_action->type, nego::ActionType::Offer);

  auto snap = s->snapshot();
  EXPECT_EQ(snap.turns, 2u);
  ASSERT_TRUE(snap.agent_offer.has_value());
  EXPECT_EQ(*snap.agent_offer, r.agent_action->bid);
  ASSERT_TRUE(snap.agent_utility_of_human_offer.has_value());
  EXPECT_DOUBLE_EQ(*snap.agent_utility_of_human_offer, fx.profile->utility(fx.worst_bid()));
  EXPECT_FALSE(snap.finished);

  fx.now += 1'000;
  const auto acc = s->human_accept();
  ASSERT_TRUE(acc.ok) << acc.error;

  snap = s->snapshot();
  EXPECT_TRUE(snap.finished);
  ASSERT_TRUE(snap.agreement.has_value());
  EXPECT_EQ(*snap.agreement, r.agent_action->bid);
  EXPECT_DOUBLE_EQ(snap.progress, 0.1);

  const auto late = s->human_offer(fx.worst_bid());
  EXPECT_FALSE(late.ok);
  EXPECT_EQ(late.error, "session finished");
}

TEST(LiveSession, AgentAcceptsNearDeadline) {
  LiveFixture fx;
  auto s = fx.make();

  fx.now += 9'600;
  const auto r = s->human_offer(fx.worst_bid());
  ASSERT_TRUE(r.ok) << r.error;
  ASSERT_TRUE(r.agent_action.has_value());
  EXPECT_EQ(r.agent_action->type, nego::ActionType::Accept);

  const auto snap = s->snapshot();
  EXPECT_TRUE(snap.finished);
  EXPECT_EQ(*snap.agreement, fx.worst_bid());
}

TEST(LiveSession, RejectsAcceptWithoutAgentOffer) {
  LiveFixture fx;
  auto s = fx.make();
  const auto r = s->human_accept();
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, "nothing to accept");
}

TEST(LiveSession, RejectsBidOutsideDomain) {
  LiveFixture fx;
  auto s = fx.make();
  const auto r = s->human_offer(nego::Bid{{0, 0}});
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, "bid not in domain");
  EXPECT_EQ(s->snapshot().turns, 0u);
}

TEST(LiveSession, DeadlineEndsSession) {
  LiveFixture fx;
  auto s = fx.make();

  fx.now += 10'000;
  const auto r = s->human_offer(fx.worst_bid());
  EXPECT_FALSE(r.ok);
  EXPECT_EQ(r.error, "deadline passed");

  const auto snap = s->snapshot();
  EXPECT_TRUE(snap.finished);
  EXPECT_FALSE(snap.agreement.has_value());
}
