#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace reservation::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

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
  friend class MemoryTransaction;

  enum class Table { kReservation, kSlotLock, kBlockedDate };

  // Committed version per record; absent = 0. Each committed write stamps
  // the record with a fresh commit sequence number, deletes drop the entry.
  using VersionMap = std::unordered_map<std::string, uint64_t>;

  struct State {
    std::unordered_map<std::string, model::ReservationRecord> reservations;
    std::unordered_map<std::string, model::SlotLockRecord> slot_locks;
    std::map<std::string, model::BlockedDateRecord> blocked_dates;
    VersionMap versions;
  };

  static std::string VersionKey(Table table, const std::string& id);

  std::shared_ptr<const State> Snapshot();

  std::mutex mutex_;
  // Immutable once published; writers install a new State on commit.
  std::shared_ptr<const State> committed_;
  uint64_t commit_seq_ = 0;
};

}
