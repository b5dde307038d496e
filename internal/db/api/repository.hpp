#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/blocked_date_record.hpp"
#include "internal/db/model/reservation_record.hpp"
#include "internal/db/model/slot_lock_record.hpp"

namespace reservation::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - ReadSlotLock and GetReservation are conflict-tracked: if another
    transaction commits a write to the same record after this read, this
    transaction's Commit() raises SerializationFailure
  - Capacity admission correctness depends on this behavior

  The DB is the source of truth for:
    reservations
    slot locks
    blocked dates
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Reservations
  // ---------------------------------------------------------------------

  virtual Result InsertReservation(Transaction&, const model::ReservationRecord&) = 0;

  virtual std::optional<model::ReservationRecord> GetReservation(Transaction&, const std::string& id) = 0;

  virtual Result UpdateReservation(Transaction&, const model::ReservationRecord&) = 0;

  virtual Result DeleteReservation(Transaction&, const std::string& id) = 0;

  // Ordered by date, then time, then creation time, all descending.
  virtual std::vector<model::ReservationRecord> ListReservations(Transaction&, const ReservationFilter& filter,
                                                                 const Pagination& pagination) = 0;

  // Sum of party_size over occupying reservations of one slot.
  virtual uint64_t SumOccupyingPartySize(Transaction&, const std::string& date, const std::string& time,
                                         reservation::engine::v1::SeatingType seating) = 0;

  // ---------------------------------------------------------------------
  // Slot locks
  // ---------------------------------------------------------------------

  // Reads the lock for slot_key, creating an empty one on first use.
  virtual model::SlotLockRecord ReadSlotLock(Transaction&, const std::string& slot_key) = 0;

  // Merge semantics: fields left empty keep their stored value.
  virtual Result UpsertSlotLock(Transaction&, const model::SlotLockRecord&) = 0;

  // ---------------------------------------------------------------------
  // Blocked dates
  // ---------------------------------------------------------------------

  virtual Result PutBlockedDate(Transaction&, const model::BlockedDateRecord&) = 0;

  virtual std::optional<model::BlockedDateRecord> GetBlockedDate(Transaction&, const std::string& date) = 0;

  virtual Result DeleteBlockedDate(Transaction&, const std::string& date) = 0;

  // Ascending by date.
  virtual std::vector<model::BlockedDateRecord> ListBlockedDates(Transaction&) = 0;
};

} // namespace reservation::db
