#include <cassert>
#include <iostream>
#include <string>

#include "internal/db/memory/memory_repository.hpp"

namespace {

using reservation::db::SerializationFailure;
using reservation::db::memory::MemoryRepository;
using reservation::db::model::ReservationRecord;
using reservation::db::model::SlotLockRecord;
using namespace reservation::engine::v1;

ReservationRecord Record(const std::string& id, uint32_t party_size) {
  ReservationRecord r;
  r.id           = id;
  r.guest_name   = "Guest";
  r.email        = "guest@example.com";
  r.phone        = "5550100100";
  r.party_size   = party_size;
  r.date         = "2030-06-10";
  r.time         = "19:00";
  r.seating_type = SEATING_TYPE_INDOOR;
  r.status       = RESERVATION_STATUS_CONFIRMED;
  return r;
}

template <typename Fn>
bool Conflicts(Fn&& fn) {
  try {
    fn();
  } catch (const SerializationFailure&) {
    return true;
  }
  return false;
}

void TestReadersKeepTheirSnapshot() {
  MemoryRepository repo;

  auto reader = repo.Begin();
  assert(repo.SumOccupyingPartySize(*reader, "2030-06-10", "19:00", SEATING_TYPE_INDOOR) == 0);

  auto writer = repo.Begin();
  assert(repo.InsertReservation(*writer, Record("a", 4)));
  writer->Commit();

  assert(repo.SumOccupyingPartySize(*reader, "2030-06-10", "19:00", SEATING_TYPE_INDOOR) == 0);
  assert(!repo.GetReservation(*reader, "a").has_value());
  reader->Commit();

  auto fresh = repo.Begin();
  assert(repo.SumOccupyingPartySize(*fresh, "2030-06-10", "19:00", SEATING_TYPE_INDOOR) == 4);
  fresh->Commit();
}

void TestUncommittedWritesStayPrivate() {
  MemoryRepository repo;

  auto writer = repo.Begin();
  assert(repo.InsertReservation(*writer, Record("a", 2)));
  assert(repo.GetReservation(*writer, "a").has_value());

  auto other = repo.Begin();
  assert(!repo.GetReservation(*other, "a").has_value());
  other->Commit();

  writer->Rollback();

  auto after = repo.Begin();
  assert(!repo.GetReservation(*after, "a").has_value());
  after->Commit();
}

void TestDeleteThenReinsertStillConflicts() {
  MemoryRepository repo;
  {
    auto tx = repo.Begin();
    assert(repo.InsertReservation(*tx, Record("a", 2)));
    tx->Commit();
  }

  auto stale = repo.Begin();
  auto seen  = repo.GetReservation(*stale, "a");
  assert(seen.has_value());

  {
    auto tx = repo.Begin();
    assert(repo.DeleteReservation(*tx, "a"));
    tx->Commit();
  }
  {
    auto tx = repo.Begin();
    assert(repo.InsertReservation(*tx, Record("a", 2)));
    tx->Commit();
  }

  seen->party_size = 3;
  assert(repo.UpdateReservation(*stale, *seen));
  assert(Conflicts([&] { stale->Commit(); }));

  auto check = repo.Begin();
  assert(repo.GetReservation(*check, "a")->party_size == 2);
  check->Commit();
}

void TestFirstSlotLockWriterWins() {
  MemoryRepository repo;

  auto first  = repo.Begin();
  auto second = repo.Begin();
  auto lock1  = repo.ReadSlotLock(*first, "2030-06-10_19:00_indoor");
  auto lock2  = repo.ReadSlotLock(*second, "2030-06-10_19:00_indoor");
  assert(lock1.last_reservation_id.empty());

  lock1.last_reservation_id = "one";
  assert(repo.UpsertSlotLock(*first, lock1));
  first->Commit();

  lock2.last_reservation_id = "two";
  assert(repo.UpsertSlotLock(*second, lock2));
  assert(Conflicts([&] { second->Commit(); }));

  auto check = repo.Begin();
  assert(repo.ReadSlotLock(*check, "2030-06-10_19:00_indoor").last_reservation_id == "one");
  check->Commit();
}

void TestUntrackedReadOnlyCommitNeverConflicts() {
  MemoryRepository repo;

  auto reader = repo.Begin();
  repo.ListReservations(*reader, {}, {});

  auto writer = repo.Begin();
  assert(repo.InsertReservation(*writer, Record("a", 2)));
  writer->Commit();

  reader->Commit();
  assert(reader->IsCommitted());
}

} // namespace

int main() {
  TestReadersKeepTheirSnapshot();
  TestUncommittedWritesStayPrivate();
  TestDeleteThenReinsertStillConflicts();
  TestFirstSlotLockWriterWins();
  TestUntrackedReadOnlyCommitNeverConflicts();

  std::cout << "reservation_engine_unit_memory_repository: pass\n";
  return 0;
}
