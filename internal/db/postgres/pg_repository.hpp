#pragma once

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace reservation::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertReservation(Transaction&, const model::ReservationRecord&) override;
  std::optional<model::ReservationRecord> GetReservation(Transaction&, const std::string&) override;
  Result UpdateReservation(Transaction&, const model::ReservationRecord&) override;
  Result DeleteReservation(Transaction&, const std::string&) override;
  std::vector<model::ReservationRecord> ListReservations(Transaction&, const ReservationFilter&,
                                                         const Pagination&) override;
  uint64_t SumOccupyingPartySize(Transaction&, const std::string& date, const std::string& time,
                                 reservation::engine::v1::SeatingType seating) override;

  model::SlotLockRecord ReadSlotLock(Transaction&, const std::string& slot_key) override;
  Result UpsertSlotLock(Transaction&, const model::SlotLockRecord&) override;

  Result PutBlockedDate(Transaction&, const model::BlockedDateRecord&) override;
  std::optional<model::BlockedDateRecord> GetBlockedDate(Transaction&, const std::string&) override;
  Result DeleteBlockedDate(Transaction&, const std::string&) override;
  std::vector<model::BlockedDateRecord> ListBlockedDates(Transaction&) override;

private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception&);
};

}
