#include <assert.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/core/slot_reservation.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/settings/booking_settings.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace reservation::engine::v1;
using reservation::core::RetryPolicy;
using reservation::core::SlotReservation;
using reservation::db::Pagination;
using reservation::db::ReservationFilter;
using reservation::db::Repository;
using reservation::db::Result;
using reservation::db::Transaction;
using reservation::db::memory::MemoryRepository;
using reservation::db::model::BlockedDateRecord;
using reservation::db::model::ReservationRecord;
using reservation::db::model::SlotLockRecord;

// Holds the first `parties` occupancy reads until all of them have arrived,
// so every first attempt observes the same pre-commit state.
class HookedRepository : public Repository {
 public:
  explicit HookedRepository(int parties) : parties_(parties) {
  }

  std::unique_ptr<Transaction> Begin() override {
    return inner_.Begin();
  }

  Result InsertReservation(Transaction& tx, const ReservationRecord& record) override {
    return inner_.InsertReservation(tx, record);
  }

  std::optional<ReservationRecord> GetReservation(Transaction& tx, const std::string& id) override {
    return inner_.GetReservation(tx, id);
  }

  Result UpdateReservation(Transaction& tx, const ReservationRecord& record) override {
    return inner_.UpdateReservation(tx, record);
  }

  Result DeleteReservation(Transaction& tx, const std::string& id) override {
    return inner_.DeleteReservation(tx, id);
  }

  std::vector<ReservationRecord> ListReservations(Transaction& tx, const ReservationFilter& filter, const Pagination& pagination) override {
    return inner_.ListReservations(tx, filter, pagination);
  }

  uint64_t SumOccupyingPartySize(Transaction& tx, const std::string& date, const std::string& time, SeatingType seating) override {
    const auto booked = inner_.SumOccupyingPartySize(tx, date, time, seating);
    sum_calls_.fetch_add(1);

    std::unique_lock lock(mutex_);
    if (arrived_ < parties_) {
      ++arrived_;
      cv_.notify_all();
      cv_.wait(lock, [this] { return arrived_ >= parties_; });
    }
    return booked;
  }

  SlotLockRecord ReadSlotLock(Transaction& tx, const std::string& slot_key) override {
    return inner_.ReadSlotLock(tx, slot_key);
  }

  Result UpsertSlotLock(Transaction& tx, const SlotLockRecord& record) override {
    return inner_.UpsertSlotLock(tx, record);
  }

  Result PutBlockedDate(Transaction& tx, const BlockedDateRecord& record) override {
    return inner_.PutBlockedDate(tx, record);
  }

  std::optional<BlockedDateRecord> GetBlockedDate(Transaction& tx, const std::string& date) override {
    return inner_.GetBlockedDate(tx, date);
  }

  Result DeleteBlockedDate(Transaction& tx, const std::string& date) override {
    return inner_.DeleteBlockedDate(tx, date);
  }

  std::vector<BlockedDateRecord> ListBlockedDates(Transaction& tx) override {
    return inner_.ListBlockedDates(tx);
  }

  int SumCalls() const {
    return sum_calls_.load();
  }

 private:
  MemoryRepository        inner_;
  const int               parties_;
  std::mutex              mutex_;
  std::condition_variable cv_;
  int                     arrived_ = 0;
  std::atomic<int>        sum_calls_{0};
};

reservation::settings::BookingSettings BalconyOfTen() {
  auto proto = reservation::settings::BookingSettings::Defaults();
  proto.set_balcony_capacity(10);
  return reservation::settings::BookingSettings(proto);
}

ReservationRecord Party(const std::string& guest, uint32_t party_size) {
  ReservationRecord r;
  r.guest_name   = guest;
  r.email        = "guest@example.com";
  r.phone        = "5550100100";
  r.party_size   = party_size;
  r.date         = "2030-06-10";
  r.time         = "19:00";
  r.seating_type = SEATING_TYPE_BALCONY;
  return r;
}

reservation::util::TimePoint FixedNow() {
  return reservation::util::FromUnixMillis(1'900'000'000'000ULL);
}

uint64_t Booked(Repository& repo) {
  auto       tx     = repo.Begin();
  const auto booked = repo.SumOccupyingPartySize(*tx, "2030-06-10", "19:00", SEATING_TYPE_BALCONY);
  tx->Commit();
  return booked;
}

void TestConcurrentPartiesCannotOverbook() {
  auto repository = std::make_shared<HookedRepository>(2);
  auto slots      = std::make_shared<SlotReservation>(repository, RetryPolicy{.max_attempts = 5, .backoff = std::chrono::milliseconds(1)}, FixedNow);
  const auto settings = BalconyOfTen();

  std::atomic<int>        successes{0};
  std::atomic<int>        rejections{0};
  std::atomic<uint32_t>   reported_remaining{999};
  std::vector<std::thread> threads;
  for (const auto* guest : {"Ada", "Grace"}) {
    threads.emplace_back([&, guest] {
      try {
        const auto id = slots->ReserveSlot(settings, Party(guest, 6));
        assert(!id.empty());
        successes.fetch_add(1);
      } catch (const reservation::util::CapacityExhausted& ex) {
        reported_remaining.store(ex.Remaining());
        rejections.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) t.join();

  assert(successes.load() == 1);
  assert(rejections.load() == 1);
  assert(reported_remaining.load() == 4);
  // Both first attempts read an empty slot; the loser re-read after its commit conflicted.
  assert(repository->SumCalls() == 3);
  assert(Booked(*repository) == 6);
}

void TestManySmallPartiesFillExactly() {
  auto repository = std::make_shared<MemoryRepository>();
  auto slots      = std::make_shared<SlotReservation>(repository, RetryPolicy{.max_attempts = 64, .backoff = std::chrono::milliseconds(1)}, FixedNow);
  const auto settings = BalconyOfTen();

  std::atomic<int>         successes{0};
  std::atomic<int>         rejections{0};
  std::atomic<int>         transient{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 16; ++i) {
    threads.emplace_back([&, i] {
      try {
        slots->ReserveSlot(settings, Party("guest-" + std::to_string(i), 1));
        successes.fetch_add(1);
      } catch (const reservation::util::CapacityExhausted& ex) {
        assert(ex.Remaining() == 0);
        rejections.fetch_add(1);
      } catch (const reservation::util::TransientConflict&) {
        transient.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) t.join();

  // A failed attempt needs a commit inside its window, so no thread can
  // conflict more than ten times; the budget of 64 is never exhausted.
  assert(transient.load() == 0);
  assert(successes.load() == 10);
  assert(rejections.load() == 6);
  assert(Booked(*repository) == 10);
}

void TestReserveAssignsIdStatusAndTimestamps() {
  auto       repository = std::make_shared<MemoryRepository>();
  SlotReservation slots(repository, RetryPolicy{}, FixedNow);

  const auto id = slots.ReserveSlot(BalconyOfTen(), Party("Ada", 2));
  assert(id.size() == 36);

  auto tx     = repository->Begin();
  auto stored = repository->GetReservation(*tx, id);
  assert(stored.has_value());
  assert(stored->status == RESERVATION_STATUS_CONFIRMED);
  assert(stored->created_at_ms == 1'900'000'000'000ULL);
  assert(stored->updated_at_ms == stored->created_at_ms);

  auto lock = repository->ReadSlotLock(*tx, "2030-06-10_19:00_balcony");
  assert(lock.last_reservation_id == id);
  tx->Commit();
}

void TestOversizedPartyIsRejectedWithoutWriting() {
  auto       repository = std::make_shared<MemoryRepository>();
  SlotReservation slots(repository, RetryPolicy{}, FixedNow);

  bool threw = false;
  try {
    slots.ReserveSlot(BalconyOfTen(), Party("Big table", 11));
  } catch (const reservation::util::CapacityExhausted& ex) {
    threw = ex.Remaining() == 10 && std::string(ex.what()) == "Only 10 balcony seats available for 2030-06-10 19:00";
  }
  assert(threw);
  assert(Booked(*repository) == 0);
}

// Every commit fails validation: a concurrent writer bumps the slot lock
// between the read and the commit of each attempt.
class AlwaysConflictingRepository : public HookedRepository {
 public:
  AlwaysConflictingRepository() : HookedRepository(0) {
  }

  Result UpsertSlotLock(Transaction& tx, const SlotLockRecord& record) override {
    auto           rival_tx = Begin();
    SlotLockRecord rival    = ReadSlotLock(*rival_tx, record.slot_key);
    rival.last_reservation_id    = "rival";
    rival.last_reservation_at_ms = 1;
    auto rc                      = HookedRepository::UpsertSlotLock(*rival_tx, rival);
    assert(rc);
    rival_tx->Commit();
    attempts_.fetch_add(1);
    return HookedRepository::UpsertSlotLock(tx, record);
  }

  int Attempts() const {
    return attempts_.load();
  }

 private:
  std::atomic<int> attempts_{0};
};

void TestRetryBudgetSurfacesTransientConflict() {
  auto       repository = std::make_shared<AlwaysConflictingRepository>();
  SlotReservation slots(repository, RetryPolicy{.max_attempts = 3, .backoff = std::chrono::milliseconds(0)}, FixedNow);

  bool threw = false;
  try {
    slots.ReserveSlot(BalconyOfTen(), Party("Ada", 2));
  } catch (const reservation::util::TransientConflict&) {
    threw = true;
  }
  assert(threw);
  assert(repository->Attempts() == 3);
  assert(Booked(*repository) == 0);
}

} // namespace

int main() {
  TestConcurrentPartiesCannotOverbook();
  TestManySmallPartiesFillExactly();
  TestReserveAssignsIdStatusAndTimestamps();
  TestOversizedPartyIsRejectedWithoutWriting();
  TestRetryBudgetSurfacesTransientConflict();

  std::cout << "reservation_engine_unit_slot_reservation_concurrency: pass\n";
  return 0;
}
