#pragma once

#include <string>

#include "internal/model/names.hpp"
#include "reservation/engine/v1.hpp"

namespace reservation::model {

/*
  One bookable unit of capacity: (dateKey, slot label, seating category).
*/
struct SlotKey {
  std::string                          date;
  std::string                          time;
  reservation::engine::v1::SeatingType seating = reservation::engine::v1::SEATING_TYPE_UNSPECIFIED;

  // "<dateKey>_<time>_<seating>", also the SlotLock primary key.
  std::string ToString() const {
    return date + "_" + time + "_" + model::ToString(seating);
  }
};

} // namespace reservation::model
