#include "memory_repository.hpp"

#include <algorithm>
#include <tuple>

#include "internal/model/state_machine.hpp"
#include "memory_tx.hpp"

namespace reservation::db::memory {

namespace {

bool Matches(const model::ReservationRecord& r, const ReservationFilter& filter) {
  if (!filter.statuses.empty() &&
      std::find(filter.statuses.begin(), filter.statuses.end(), r.status) == filter.statuses.end()) {
    return false;
  }
  if (filter.date && r.date != *filter.date) return false;
  if (filter.email && r.email != *filter.email) return false;
  if (filter.seating && r.seating_type != *filter.seating) return false;
  return true;
}

bool NewestFirst(const model::ReservationRecord& a, const model::ReservationRecord& b) {
  return std::tie(a.date, a.time, a.created_at_ms, a.id) > std::tie(b.date, b.time, b.created_at_ms, b.id);
}

} // namespace

MemoryRepository::MemoryRepository() : committed_(std::make_shared<const State>()) {
}

std::shared_ptr<const MemoryRepository::State> MemoryRepository::Snapshot() {
  std::scoped_lock lock(mutex_);
  return committed_;
}

std::string MemoryRepository::VersionKey(Table table, const std::string& id) {
  switch (table) {
    case Table::kReservation:
      return "reservation/" + id;
    case Table::kSlotLock:
      return "slot_lock/" + id;
    case Table::kBlockedDate:
      return "blocked_date/" + id;
  }
  return id;
}

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertReservation(Transaction& t, const model::ReservationRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.reservations.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists);
  s.reservations[r.id] = r;
  TX(t).MarkDirty(Table::kReservation, r.id);
  return Result::Ok();
}

std::optional<model::ReservationRecord> MemoryRepository::GetReservation(Transaction& t, const std::string& id) {
  TX(t).TrackRead(Table::kReservation, id);
  const auto& s  = TX(t).View();
  const auto  it = s.reservations.find(id);
  if (it == s.reservations.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateReservation(Transaction& t, const model::ReservationRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.reservations.contains(r.id)) return Result::Err(ErrorCode::NotFound);
  s.reservations[r.id] = r;
  TX(t).MarkDirty(Table::kReservation, r.id);
  return Result::Ok();
}

Result MemoryRepository::DeleteReservation(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.reservations.erase(id) == 0) return Result::Err(ErrorCode::NotFound);
  TX(t).MarkDirty(Table::kReservation, id);
  return Result::Ok();
}

std::vector<model::ReservationRecord> MemoryRepository::ListReservations(Transaction& t, const ReservationFilter& filter,
                                                                         const Pagination& pagination) {
  const auto&                            s = TX(t).View();
  std::vector<model::ReservationRecord> matched;
  for (const auto& [_, record] : s.reservations) {
    if (Matches(record, filter)) matched.push_back(record);
  }
  std::sort(matched.begin(), matched.end(), NewestFirst);

  if (pagination.offset >= matched.size()) return {};
  const auto begin = matched.begin() + static_cast<std::ptrdiff_t>(pagination.offset);
  const auto count = std::min(pagination.limit, matched.size() - pagination.offset);
  return std::vector<model::ReservationRecord>(begin, begin + static_cast<std::ptrdiff_t>(count));
}

uint64_t MemoryRepository::SumOccupyingPartySize(Transaction& t, const std::string& date, const std::string& time,
                                                 reservation::engine::v1::SeatingType seating) {
  uint64_t booked = 0;
  for (const auto& [_, r] : TX(t).View().reservations) {
    if (r.date == date && r.time == time && r.seating_type == seating && reservation::model::IsOccupying(r.status)) {
      booked += r.party_size;
    }
  }
  return booked;
}

model::SlotLockRecord MemoryRepository::ReadSlotLock(Transaction& t, const std::string& slot_key) {
  TX(t).TrackRead(Table::kSlotLock, slot_key);
  const auto& s  = TX(t).View();
  const auto  it = s.slot_locks.find(slot_key);
  if (it == s.slot_locks.end()) {
    model::SlotLockRecord fresh;
    fresh.slot_key = slot_key;
    return fresh;
  }
  return it->second;
}

Result MemoryRepository::UpsertSlotLock(Transaction& t, const model::SlotLockRecord& r) {
  auto& stored    = TX(t).Mutable().slot_locks[r.slot_key];
  stored.slot_key = r.slot_key;
  if (!r.last_reservation_id.empty()) stored.last_reservation_id = r.last_reservation_id;
  if (r.last_reservation_at_ms != 0) stored.last_reservation_at_ms = r.last_reservation_at_ms;
  TX(t).MarkDirty(Table::kSlotLock, r.slot_key);
  return Result::Ok();
}

Result MemoryRepository::PutBlockedDate(Transaction& t, const model::BlockedDateRecord& r) {
  TX(t).Mutable().blocked_dates[r.date] = r;
  TX(t).MarkDirty(Table::kBlockedDate, r.date);
  return Result::Ok();
}

std::optional<model::BlockedDateRecord> MemoryRepository::GetBlockedDate(Transaction& t, const std::string& date) {
  const auto& s  = TX(t).View();
  const auto  it = s.blocked_dates.find(date);
  if (it == s.blocked_dates.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::DeleteBlockedDate(Transaction& t, const std::string& date) {
  if (TX(t).Mutable().blocked_dates.erase(date) == 0) return Result::Err(ErrorCode::NotFound);
  TX(t).MarkDirty(Table::kBlockedDate, date);
  return Result::Ok();
}

std::vector<model::BlockedDateRecord> MemoryRepository::ListBlockedDates(Transaction& t) {
  std::vector<model::BlockedDateRecord> out;
  for (const auto& [_, record] : TX(t).View().blocked_dates) {
    out.push_back(record);
  }
  return out;
}

} // namespace reservation::db::memory
