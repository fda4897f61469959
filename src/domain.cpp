#include "nego/domain.hpp"

#include <limits>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace nego {

Domain::Domain(std::string name, std::vector<Issue> issues)
  : name_(std::move(name)), issues_(std::move(issues)) {
  if (issues_.empty()) throw std::invalid_argument("domain '" + name_ + "' has no issues");

  std::unordered_set<std::string> seen_issues;
  uint64_t total = 1;

  for (const auto& iss : issues_) {
    if (!seen_issues.insert(iss.name).second) {
      throw std::invalid_argument("duplicate issue '" + iss.name + "'");
    }
    if (iss.values.empty()) {
      throw std::invalid_argument("issue '" + iss.name + "' has no values");
    }

    std::unordered_set<std::string> seen_values;
    for (const auto& v : iss.values) {
      if (!seen_values.insert(v).second) {
        throw std::invalid_argument("duplicate value '" + v + "' in issue '" + iss.name + "'");
      }
    }

    const uint64_t n = static_cast<uint64_t>(iss.values.size());
    if (total > std::numeric_limits<uint64_t>::max() / n) {
      throw std::overflow_error("bid space of domain '" + name_ + "' exceeds 64 bits");
    }
    total *= n;
  }

  size_ = total;
}

Bid Domain::get(uint64_t index) const {
  Bid b;
  b.values.resize(issues_.size());

  for (std::size_t i = issues_.size(); i-- > 0;) {
    const uint64_t n = static_cast<uint64_t>(issues_[i].values.size());
    b.values[i] = static_cast<ValueIndex>(index % n);
    index /= n;
  }
  return b;
}

bool Domain::contains(const Bid& bid) const noexcept {
  if (bid.size() != issues_.size()) return false;
  for (std::size_t i = 0; i < issues_.size(); ++i) {
    if (bid[i] >= issues_[i].values.size()) return false;
  }
  return true;
}

std::optional<std::size_t> Domain::issue_index(const std::string& issue) const {
  for (std::size_t i = 0; i < issues_.size(); ++i) {
    if (issues_[i].name == issue) return i;
  }
  return std::nullopt;
}

std::optional<ValueIndex> Domain::value_index(std::size_t issue, const std::string& value) const {
  if (issue >= issues_.size()) return std::nullopt;
  const auto& vals = issues_[issue].values;
  for (std::size_t v = 0; v < vals.size(); ++v) {
    if (vals[v] == value) return static_cast<ValueIndex>(v);
  }
  return std::nullopt;
}

std::optional<Bid> Domain::make_bid(const std::map<std::string, std::string>& named) const {
  Bid b;
  b.values.reserve(issues_.size());

  for (std::size_t i = 0; i < issues_.size(); ++i) {
    auto it = named.find(issues_[i].name);
    if (it == named.end()) return std::nullopt;
    auto v = value_index(i, it->second);
    if (!v) return std::nullopt;
    b.values.push_back(*v);
  }
  return b;
}

std::string Domain::to_string(const Bid& bid) const {
  std::ostringstream o;
  o << "{";
  for (std::size_t i = 0; i < issues_.size() && i < bid.size(); ++i) {
    if (i) o << ", ";
    o << issues_[i].name << "=";
    if (bid[i] < issues_[i].values.size()) o << issues_[i].values[bid[i]];
    else o << "?";
  }
  o << "}";
  return o.str();
}

} // namespace nego
