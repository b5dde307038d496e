#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/reservation_record.hpp"
#include "internal/settings/booking_settings.hpp"
#include "internal/util/time.hpp"

namespace reservation::core {

struct RetryPolicy {
  uint32_t                  max_attempts = 5;
  std::chrono::milliseconds backoff{10};
};

/*
  Atomic capacity check + reservation insert for one SlotKey.

  Every attempt runs as a single transaction that
    1. reads (and creates on first use) the SlotLock,
    2. recomputes booked seats for the key,
    3. rejects with CapacityExhausted when the party does not fit,
    4. inserts the reservation and rewrites the SlotLock,
    5. commits.

  Two commits on the same key always conflict on the SlotLock, so the
  loser re-runs from step 1 and sees the winner's reservation. Attempts
  are bounded by RetryPolicy; exhausting them raises TransientConflict.
*/
class SlotReservation {
 public:
  SlotReservation(std::shared_ptr<reservation::db::Repository> repository, RetryPolicy policy, reservation::util::NowFn now);

  // `reservation` carries the slot, party size and guest fields. id,
  // status and timestamps are assigned here. Returns the new id.
  std::string ReserveSlot(const reservation::settings::BookingSettings& settings, reservation::db::model::ReservationRecord reservation);

  const RetryPolicy& Policy() const {
    return policy_;
  }

 private:
  std::shared_ptr<reservation::db::Repository> repository_;
  RetryPolicy                                  policy_;
  reservation::util::NowFn                     now_;
};

} // namespace reservation::core
