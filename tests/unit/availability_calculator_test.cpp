#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/core/availability_calculator.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/settings/settings_provider.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace reservation::engine::v1;
using reservation::core::AvailabilityCalculator;
using reservation::db::model::ReservationRecord;

struct Fixture {
  std::shared_ptr<reservation::db::memory::MemoryRepository>       repository;
  std::shared_ptr<reservation::settings::CachedSettingsProvider> settings;
  std::shared_ptr<AvailabilityCalculator>                          calculator;
};

Fixture MakeFixture() {
  auto proto = reservation::settings::BookingSettings::Defaults();
  proto.set_indoor_capacity(12);
  proto.set_balcony_capacity(10);

  Fixture f;
  f.repository = std::make_shared<reservation::db::memory::MemoryRepository>();
  f.settings   = std::make_shared<reservation::settings::CachedSettingsProvider>(proto);
  f.calculator = std::make_shared<AvailabilityCalculator>(f.repository, f.settings);
  return f;
}

void Seed(Fixture& f, const std::string& id, const std::string& time, SeatingType seating, uint32_t party_size, ReservationStatus status) {
  ReservationRecord r;
  r.id           = id;
  r.guest_name   = "Guest";
  r.email        = "guest@example.com";
  r.phone        = "5550100100";
  r.party_size   = party_size;
  r.date         = "2030-06-10";
  r.time         = time;
  r.seating_type = seating;
  r.status       = status;

  auto tx = f.repository->Begin();
  auto rc = f.repository->InsertReservation(*tx, r);
  assert(rc);
  tx->Commit();
}

void TestEmptySlotHasFullCapacity() {
  auto f      = MakeFixture();
  auto result = f.calculator->ComputeSlotAvailability("2030-06-10", "19:00", SEATING_TYPE_INDOOR);
  assert(result.total_capacity() == 12);
  assert(result.booked_count() == 0);
  assert(result.remaining_capacity() == 12);
  assert(result.available());
}

void TestOnlyOccupyingStatusesCount() {
  auto f = MakeFixture();
  Seed(f, "pending", "19:00", SEATING_TYPE_BALCONY, 1, RESERVATION_STATUS_PENDING);
  Seed(f, "confirmed", "19:00", SEATING_TYPE_BALCONY, 2, RESERVATION_STATUS_CONFIRMED);
  Seed(f, "seated", "19:00", SEATING_TYPE_BALCONY, 3, RESERVATION_STATUS_SEATED);
  Seed(f, "completed", "19:00", SEATING_TYPE_BALCONY, 4, RESERVATION_STATUS_COMPLETED);
  Seed(f, "cancelled", "19:00", SEATING_TYPE_BALCONY, 5, RESERVATION_STATUS_CANCELLED);
  Seed(f, "no-show", "19:00", SEATING_TYPE_BALCONY, 6, RESERVATION_STATUS_NO_SHOW);

  auto balcony = f.calculator->ComputeSlotAvailability("2030-06-10", "19:00", SEATING_TYPE_BALCONY);
  assert(balcony.total_capacity() == 10);
  assert(balcony.booked_count() == 6);
  assert(balcony.remaining_capacity() == 4);
  assert(balcony.available());
}

void TestCategoriesAndSlotsAreIndependent() {
  auto f = MakeFixture();
  Seed(f, "indoor", "19:00", SEATING_TYPE_INDOOR, 12, RESERVATION_STATUS_CONFIRMED);
  Seed(f, "other-slot", "19:30", SEATING_TYPE_BALCONY, 4, RESERVATION_STATUS_CONFIRMED);

  auto indoor = f.calculator->ComputeSlotAvailability("2030-06-10", "19:00", SEATING_TYPE_INDOOR);
  assert(indoor.remaining_capacity() == 0);
  assert(!indoor.available());

  auto balcony = f.calculator->ComputeSlotAvailability("2030-06-10", "19:00", SEATING_TYPE_BALCONY);
  assert(balcony.remaining_capacity() == 10);

  assert(f.calculator->CanAccommodate("2030-06-10", "19:30", SEATING_TYPE_BALCONY, 6));
  assert(!f.calculator->CanAccommodate("2030-06-10", "19:30", SEATING_TYPE_BALCONY, 7));
}

void TestRemainingIsClampedAfterCapacityShrinks() {
  auto f = MakeFixture();
  Seed(f, "big", "18:00", SEATING_TYPE_INDOOR, 10, RESERVATION_STATUS_CONFIRMED);

  auto smaller = f.settings->Snapshot()->Proto();
  smaller.set_indoor_capacity(6);
  f.settings->Update(smaller);

  auto result = f.calculator->ComputeSlotAvailability("2030-06-10", "18:00", SEATING_TYPE_INDOOR);
  assert(result.total_capacity() == 6);
  assert(result.booked_count() == 10);
  assert(result.remaining_capacity() == 0);
  assert(!result.available());
}

void TestInvalidInputsAreRejected() {
  auto f = MakeFixture();

  auto rejects = [&](const std::string& date, const std::string& time, SeatingType seating) {
    try {
      f.calculator->ComputeSlotAvailability(date, time, seating);
    } catch (const reservation::util::ValidationError&) {
      return true;
    }
    return false;
  };

  assert(rejects("2030-06-31", "19:00", SEATING_TYPE_INDOOR));
  assert(rejects("2030-06-10", "19:15", SEATING_TYPE_INDOOR));
  assert(rejects("2030-06-10", "19:00", SEATING_TYPE_UNSPECIFIED));
}

void TestMakeResult() {
  auto full = AvailabilityCalculator::MakeResult(8, 8);
  assert(full.remaining_capacity() == 0);
  assert(!full.available());

  auto over = AvailabilityCalculator::MakeResult(8, 11);
  assert(over.booked_count() == 11);
  assert(over.remaining_capacity() == 0);

  auto open = AvailabilityCalculator::MakeResult(8, 3);
  assert(open.remaining_capacity() == 5);
  assert(open.available());
}

} // namespace

int main() {
  TestEmptySlotHasFullCapacity();
  TestOnlyOccupyingStatusesCount();
  TestCategoriesAndSlotsAreIndependent();
  TestRemainingIsClampedAfterCapacityShrinks();
  TestInvalidInputsAreRejected();
  TestMakeResult();

  std::cout << "reservation_engine_unit_availability_calculator: pass\n";
  return 0;
}
