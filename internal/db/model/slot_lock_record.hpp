#pragma once

#include <cstdint>
#include <string>

namespace reservation::db::model {

/*
  Serialization record, one per SlotKey.

  Carries no capacity state. Every successful reservation commit for the
  key rewrites it so that concurrent commits on the same key collide.
*/

struct SlotLockRecord {
  std::string slot_key;

  std::string last_reservation_id;
  uint64_t    last_reservation_at_ms = 0;
};

}
