#pragma once
#include <cstdint>
#include <string>

namespace nego {

using Ts = int64_t;          // milliseconds
using ValueIndex = uint32_t; // index into one issue's value set
using PartyId = std::string; // "<name>_<position>"

// Party name without the trailing "_<position>" suffix.
inline std::string party_name(const PartyId& id) {
  const auto pos = id.rfind('_');
  if (pos == std::string::npos) return id;
  return id.substr(0, pos);
}

} // namespace nego
