#include "nego/scenario.hpp"

#include <stdexcept>

namespace nego {

Domain make_party_domain() {
  return Domain("party", {
      Issue{"food", {"finger_food", "chips_nuts", "catering", "handmade"}},
      Issue{"drinks", {"beer", "non_alcoholic", "handmade_cocktails", "catering"}},
      Issue{"location", {"party_tent", "your_dorm", "party_room", "ballroom"}},
      Issue{"invitations", {"plain", "photo", "custom_handmade", "custom_printed"}},
      Issue{"music", {"mp3", "dj", "band"}},
      Issue{"cleanup", {"water_and_soap", "specialized_materials", "special_equipment", "hired_help"}},
  });
}

LinearAdditiveUtilitySpace make_party_profile(int side) {
  if (side == 0) {
    return LinearAdditiveUtilitySpace(
        make_party_domain(),
        {0.25, 0.20, 0.15, 0.10, 0.20, 0.10},
        {
            {0.25, 0.50, 1.00, 0.75},
            {0.30, 0.20, 1.00, 0.70},
            {0.50, 0.20, 0.80, 1.00},
            {0.20, 0.40, 1.00, 0.80},
            {0.30, 0.70, 1.00},
            {0.20, 0.40, 0.60, 1.00},
        });
  }
  if (side == 1) {
    return LinearAdditiveUtilitySpace(
        make_party_domain(),
        {0.30, 0.10, 0.25, 0.05, 0.10, 0.20},
        {
            {1.00, 0.80, 0.20, 0.50},
            {1.00, 0.60, 0.10, 0.30},
            {0.70, 1.00, 0.40, 0.10},
            {1.00, 0.60, 0.10, 0.30},
            {1.00, 0.60, 0.20},
            {1.00, 0.70, 0.40, 0.10},
        });
  }
  throw std::invalid_argument("party profile side must be 0 or 1");
}

} // namespace nego
