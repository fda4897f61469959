#pragma once
#include "nego/domain.hpp"
#include "nego/utility_space.hpp"

namespace nego {

// Built-in "party planning" domain used by the executables.
Domain make_party_domain();

// Two opposing profiles over make_party_domain(); side 0 or 1.
LinearAdditiveUtilitySpace make_party_profile(int side);

} // namespace nego
