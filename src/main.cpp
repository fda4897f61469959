#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <utility>

#include "nego/agent.hpp"
#include "nego/reporter.hpp"
#include "nego/rng.hpp"
#include "nego/scenario.hpp"
#include "nego/session.hpp"

#include "nego/parties/random_party.hpp"
#include "nego/parties/time_dependent_party.hpp"

static void write_trace_csv(const std::string& path,
                            const nego::UtilitySpace& mine,
                            const nego::UtilitySpace& theirs,
                            const std::vector<nego::Action>& actions) {
  std::ofstream f(path);
  if (!f) {
    std::cerr << "cannot write " << path << "\n";
    return;
  }
  f << "turn,actor,type,bid,u_agent,u_opponent\n";
  const auto& d = mine.domain();
  for (std::size_t i = 0; i < actions.size(); ++i) {
    const auto& a = actions[i];
    f << i << "," << a.actor << ","
      << (a.type == nego::ActionType::Offer ? "offer" : "accept") << ","
      << "\"" << d.to_string(a.bid) << "\","
      << mine.utility(a.bid) << "," << theirs.utility(a.bid) << "\n";
  }
}

int main(int argc, char** argv) {
  uint64_t seed = 1;
  uint32_t rounds = 200;
  std::string opponent = "boulware";
  std::string storage_dir = ".";

  if (argc >= 2) seed = static_cast<uint64_t>(std::stoull(argv[1]));
  if (argc >= 3) rounds = static_cast<uint32_t>(std::stoul(argv[2]));
  if (argc >= 4) opponent = argv[3];
  if (argc >= 5) storage_dir = argv[4];

  if (rounds == 0) {
    std::cerr << "rounds must be positive\n";
    return 1;
  }
  if (opponent != "boulware" && opponent != "random") {
    std::cerr << "usage: nego_sim [seed] [rounds] [boulware|random] [storage_dir]\n";
    return 1;
  }

  auto mine = std::make_shared<const nego::LinearAdditiveUtilitySpace>(nego::make_party_profile(0));
  auto theirs = std::make_shared<const nego::LinearAdditiveUtilitySpace>(nego::make_party_profile(1));
  auto progress = std::make_shared<nego::ProgressRounds>(rounds);

  // deterministic per-party seeding
  uint64_t sm = seed;
  const uint64_t agent_seed = nego::splitmix64(sm);
  const uint64_t opp_seed = nego::splitmix64(sm);

  nego::SaopSession session(mine->domain(), progress);

  nego::SessionSettings as{};
  as.id = "frankenagent_1";
  as.profile = mine;
  as.progress = progress;
  as.storage_dir = storage_dir;
  session.add_party(std::make_unique<nego::FrankenAgent>(
      as, agent_seed, std::make_shared<nego::StreamReporter>(std::clog, nego::LogLevel::Warning)));

  nego::SessionSettings os{};
  os.id = opponent + "_2";
  os.profile = theirs;
  os.progress = progress;
  if (opponent == "random") {
    session.add_party(std::make_unique<nego::parties::RandomParty>(os, opp_seed));
  } else {
    session.add_party(std::make_unique<nego::parties::TimeDependentParty>(os));
  }

  const auto res = session.run();

  write_trace_csv("trace.csv", *mine, *theirs, res.actions);

  std::cout << "seed=" << seed
            << " rounds=" << res.rounds_played
            << " actions=" << res.actions.size();
  if (res.error != nego::ProtocolError::None) {
    std::cout << " error=" << nego::to_string(res.error) << " offender=" << res.offender;
  }
  if (res.agreement) {
    std::cout << " agreement=" << mine->domain().to_string(*res.agreement)
              << " u_agent=" << mine->utility(*res.agreement)
              << " u_opponent=" << theirs->utility(*res.agreement);
  } else {
    std::cout << " agreement=none";
  }
  std::cout << "\n";

  return res.error == nego::ProtocolError::None ? 0 : 2;
}
