#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace reservation::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
