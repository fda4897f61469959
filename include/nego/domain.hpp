#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "nego/types.hpp"

namespace nego {

struct Issue {
  std::string name;
  std::vector<std::string> values;
};

// One value per issue, in the owning domain's issue order.
struct Bid {
  std::vector<ValueIndex> values;

  ValueIndex operator[](std::size_t issue) const noexcept { return values[issue]; }
  std::size_t size() const noexcept { return values.size(); }

  friend bool operator==(const Bid&, const Bid&) = default;
};

class Domain {
public:
  // Throws std::invalid_argument on malformed issues and std::overflow_error
  // when the bid space does not fit in 64 bits.
  Domain(std::string name, std::vector<Issue> issues);

  const std::string& name() const noexcept { return name_; }
  const std::vector<Issue>& issues() const noexcept { return issues_; }
  std::size_t issue_count() const noexcept { return issues_.size(); }
  std::size_t value_count(std::size_t issue) const noexcept { return issues_[issue].values.size(); }

  // Number of distinct bids (cross product of all value sets).
  uint64_t size() const noexcept { return size_; }

  // Mixed-radix addressing, last issue varies fastest. Requires index < size().
  Bid get(uint64_t index) const;

  bool contains(const Bid& bid) const noexcept;

  std::optional<std::size_t> issue_index(const std::string& issue) const;
  std::optional<ValueIndex> value_index(std::size_t issue, const std::string& value) const;

  // Builds a bid from issue -> value names; nullopt when an issue is missing
  // or a name is unknown.
  std::optional<Bid> make_bid(const std::map<std::string, std::string>& named) const;

  std::string to_string(const Bid& bid) const;

private:
  std::string name_;
  std::vector<Issue> issues_;
  uint64_t size_{0};
};

} // namespace nego
