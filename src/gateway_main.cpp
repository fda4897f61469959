#include <cstdlib>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "httplib.h"

#include "nego/live_session.hpp"
#include "nego/reporter.hpp"
#include "nego/scenario.hpp"

// -------------------- JSON helpers --------------------
static std::string json_escape(const std::string& s) {
  std::string out;
  out.reserve(s.size() + 8);
  for (char c : s) {
    switch (c) {
      case '\\': out += "\\\\"; break;
      case '"':  out += "\\\""; break;
      case '\n': out += "\\n"; break;
      case '\r': out += "\\r"; break;
      case '\t': out += "\\t"; break;
      default: out += c; break;
    }
  }
  return out;
}

static std::string bid_to_json(const nego::Domain& d, const std::optional<nego::Bid>& b) {
  if (!b) return "null";
  std::ostringstream o;
  o << "{";
  for (std::size_t i = 0; i < d.issue_count(); ++i) {
    if (i) o << ",";
    const auto& iss = d.issues()[i];
    o << "\"" << json_escape(iss.name) << "\":\"" << json_escape(iss.values[(*b)[i]]) << "\"";
  }
  o << "}";
  return o.str();
}

static std::string opt_to_json(std::optional<double> x) {
  if (!x) return "null";
  std::ostringstream o;
  o << *x;
  return o.str();
}

static std::string reply_to_json(const nego::Domain& d, const nego::LiveSession::Reply& r) {
  std::ostringstream o;
  o << "{\"ok\":" << (r.ok ? "true" : "false")
    << ",\"error\":\"" << json_escape(r.error) << "\""
    << ",\"agent_action\":";
  if (!r.agent_action) {
    o << "null";
  } else {
    const auto& a = *r.agent_action;
    o << "{\"type\":\"" << (a.type == nego::ActionType::Offer ? "offer" : "accept") << "\""
      << ",\"bid\":" << bid_to_json(d, a.bid) << "}";
  }
  o << "}";
  return o.str();
}

// -------------------- main --------------------
int main(int argc, char** argv) {
  int port = 8080;
  uint64_t seed = 1;
  double duration_s = 300.0;
  std::string storage_dir = ".";
  if (argc >= 2) port = std::atoi(argv[1]);
  if (argc >= 3) seed = static_cast<uint64_t>(std::stoull(argv[2]));
  if (argc >= 4) duration_s = std::stod(argv[3]);
  if (argc >= 5) storage_dir = argv[4];

  if (duration_s <= 0.0) {
    std::cerr << "duration must be positive\n";
    return 1;
  }

  auto profile = std::make_shared<const nego::LinearAdditiveUtilitySpace>(nego::make_party_profile(0));
  nego::LiveSession session(profile,
                            static_cast<nego::Ts>(duration_s * 1000.0),
                            seed,
                            storage_dir,
                            std::make_shared<nego::StreamReporter>());
  const nego::Domain& domain = session.domain();

  httplib::Server svr;

  // Issues and their values
  svr.Get("/api/domain", [&](const httplib::Request&, httplib::Response& res) {
    std::ostringstream o;
    o << "{\"name\":\"" << json_escape(domain.name()) << "\",\"issues\":[";
    for (std::size_t i = 0; i < domain.issue_count(); ++i) {
      const auto& iss = domain.issues()[i];
      if (i) o << ",";
      o << "{\"name\":\"" << json_escape(iss.name) << "\",\"values\":[";
      for (std::size_t v = 0; v < iss.values.size(); ++v) {
        if (v) o << ",";
        o << "\"" << json_escape(iss.values[v]) << "\"";
      }
      o << "]}";
    }
    o << "]}";
    res.set_content(o.str(), "application/json");
  });

  svr.Get("/api/state", [&](const httplib::Request&, httplib::Response& res) {
    const auto s = session.snapshot();

    std::ostringstream o;
    o << "{"
      << "\"progress\":" << s.progress << ","
      << "\"turns\":" << s.turns << ","
      << "\"finished\":" << (s.finished ? "true" : "false") << ","
      << "\"human_offer\":" << bid_to_json(domain, s.human_offer) << ","
      << "\"agent_offer\":" << bid_to_json(domain, s.agent_offer) << ","
      << "\"agent_utility_of_human_offer\":" << opt_to_json(s.agent_utility_of_human_offer) << ","
      << "\"agent_utility_of_agent_offer\":" << opt_to_json(s.agent_utility_of_agent_offer) << ","
      << "\"agreement\":" << bid_to_json(domain, s.agreement)
      << "}";
    res.set_content(o.str(), "application/json");
  });

  // Offer: one form parameter per issue, value given by name
  svr.Post("/api/offer", [&](const httplib::Request& req, httplib::Response& res) {
    std::map<std::string, std::string> named;
    for (const auto& iss : domain.issues()) {
      if (req.has_param(iss.name)) named[iss.name] = req.get_param_value(iss.name);
    }

    const auto bid = domain.make_bid(named);
    if (!bid) {
      res.status = 400;
      res.set_content("{\"ok\":false,\"error\":\"incomplete or unknown bid\",\"agent_action\":null}",
                      "application/json");
      return;
    }

    const auto r = session.human_offer(*bid);
    if (!r.ok) res.status = 409;
    res.set_content(reply_to_json(domain, r), "application/json");
  });

  svr.Post("/api/accept", [&](const httplib::Request&, httplib::Response& res) {
    const auto r = session.human_accept();
    if (!r.ok) res.status = 409;
    res.set_content(reply_to_json(domain, r), "application/json");
  });

  std::cout << "NEGO gateway running on http://localhost:" << port
            << " (seed=" << seed << ", duration_s=" << duration_s << ")\n";

  svr.listen("0.0.0.0", port);
  return 0;
}
