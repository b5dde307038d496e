#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/availability_calculator.hpp"
#include "internal/core/blocked_date_registry.hpp"
#include "internal/core/daily_availability.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/settings/settings_provider.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace reservation::engine::v1;
using reservation::db::model::ReservationRecord;

struct Fixture {
  std::shared_ptr<reservation::db::memory::MemoryRepository>  repository;
  std::shared_ptr<reservation::core::BlockedDateRegistry>         blocked_dates;
  std::shared_ptr<reservation::core::DailyAvailabilityAggregator> daily;
};

Fixture MakeFixture() {
  reservation::engine::v1::BookingSettings proto = reservation::settings::BookingSettings::Defaults();
  proto.set_indoor_capacity(8);
  proto.set_balcony_capacity(4);
  proto.clear_time_slots();
  proto.add_time_slots("18:00");
  proto.add_time_slots("19:00");
  proto.add_time_slots("20:00");

  const auto fixed_now = reservation::util::FromUnixMillis(1'900'000'000'000ULL);

  Fixture f;
  f.repository    = std::make_shared<reservation::db::memory::MemoryRepository>();
  auto settings   = std::make_shared<reservation::settings::CachedSettingsProvider>(proto);
  auto calculator = std::make_shared<reservation::core::AvailabilityCalculator>(f.repository, settings);
  f.blocked_dates = std::make_shared<reservation::core::BlockedDateRegistry>(f.repository, [fixed_now] { return fixed_now; });
  f.daily         = std::make_shared<reservation::core::DailyAvailabilityAggregator>(calculator, f.blocked_dates, settings);
  return f;
}

void Seed(Fixture& f, const std::string& id, const std::string& time, SeatingType seating, uint32_t party_size) {
  ReservationRecord r;
  r.id           = id;
  r.guest_name   = "Guest";
  r.email        = "guest@example.com";
  r.phone        = "5550100100";
  r.party_size   = party_size;
  r.date         = "2030-06-10";
  r.time         = time;
  r.seating_type = seating;
  r.status       = RESERVATION_STATUS_CONFIRMED;

  auto tx = f.repository->Begin();
  auto rc = f.repository->InsertReservation(*tx, r);
  assert(rc);
  tx->Commit();
}

void TestSlotsFollowConfiguredOrder() {
  auto f = MakeFixture();
  Seed(f, "a", "19:00", SEATING_TYPE_INDOOR, 5);
  Seed(f, "b", "20:00", SEATING_TYPE_INDOOR, 8);
  Seed(f, "c", "20:00", SEATING_TYPE_BALCONY, 4);

  auto day = f.daily->GetDailyAvailability("2030-06-10");
  assert(day.date() == "2030-06-10");
  assert(!day.is_blocked());
  assert(!day.has_notes());
  assert(day.time_slots_size() == 3);

  assert(day.time_slots(0).time() == "18:00");
  assert(day.time_slots(0).available_indoor() == 8);
  assert(day.time_slots(0).available_balcony() == 4);
  assert(day.time_slots(0).is_available());

  assert(day.time_slots(1).time() == "19:00");
  assert(day.time_slots(1).available_indoor() == 3);
  assert(day.time_slots(1).available_balcony() == 4);

  assert(day.time_slots(2).time() == "20:00");
  assert(day.time_slots(2).available_indoor() == 0);
  assert(day.time_slots(2).available_balcony() == 0);
  assert(!day.time_slots(2).is_available());

  assert(f.daily->HasAnyAvailability("2030-06-10"));
}

void TestBlockedDateShortCircuits() {
  auto f = MakeFixture();
  f.blocked_dates->Block("2030-06-10", "Private event");

  auto day = f.daily->GetDailyAvailability("2030-06-10");
  assert(day.is_blocked());
  assert(day.notes() == "Private event");
  assert(day.time_slots_size() == 0);

  assert(!f.daily->HasAnyAvailability("2030-06-10"));

  auto slots = f.daily->ListAvailableSlotsForParty("2030-06-10", 2, SEATING_TYPE_BALCONY);
  assert(slots.indoor.empty());
  assert(slots.balcony.empty());

  f.blocked_dates->Unblock("2030-06-10");
  auto reopened = f.daily->GetDailyAvailability("2030-06-10");
  assert(!reopened.is_blocked());
  assert(reopened.time_slots_size() == 3);
}

void TestSlotsForPartyFilterByRemaining() {
  auto f = MakeFixture();
  Seed(f, "a", "19:00", SEATING_TYPE_INDOOR, 5);
  Seed(f, "b", "18:00", SEATING_TYPE_BALCONY, 1);

  auto slots = f.daily->ListAvailableSlotsForParty("2030-06-10", 4, SEATING_TYPE_BALCONY);
  assert(slots.preferred == SEATING_TYPE_BALCONY);
  assert((slots.indoor == std::vector<std::string>{"18:00", "20:00"}));
  assert((slots.balcony == std::vector<std::string>{"19:00", "20:00"}));

  // The preference never filters.
  auto indoor_pref = f.daily->ListAvailableSlotsForParty("2030-06-10", 4, SEATING_TYPE_INDOOR);
  assert(indoor_pref.balcony == slots.balcony);
}

void TestFullDayHasNoAvailability() {
  auto f = MakeFixture();
  for (const auto* time : {"18:00", "19:00", "20:00"}) {
    Seed(f, std::string("in-") + time, time, SEATING_TYPE_INDOOR, 8);
    Seed(f, std::string("out-") + time, time, SEATING_TYPE_BALCONY, 4);
  }
  assert(!f.daily->HasAnyAvailability("2030-06-10"));
  assert(f.daily->HasAnyAvailability("2030-06-11"));
}

void TestInvalidArgumentsAreRejected() {
  auto f = MakeFixture();

  bool threw = false;
  try {
    f.daily->ListAvailableSlotsForParty("2030-06-10", 0, SEATING_TYPE_UNSPECIFIED);
  } catch (const reservation::util::ValidationError&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.daily->GetDailyAvailability("10/06/2030");
  } catch (const reservation::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestBlockedDateRegistry() {
  auto f = MakeFixture();
  f.blocked_dates->Block("2030-12-25", "Holiday");
  f.blocked_dates->Block("2030-01-01", "New year");
  auto replaced = f.blocked_dates->Block("2030-12-25", "Staff party");
  assert(replaced.reason() == "Staff party");
  assert(replaced.created_at().seconds() == 1'900'000'000);

  auto listed = f.blocked_dates->List();
  assert(listed.size() == 2);
  assert(listed[0].date() == "2030-01-01");
  assert(listed[1].date() == "2030-12-25");
  assert(listed[1].reason() == "Staff party");

  assert(f.blocked_dates->Find("2030-12-25").has_value());
  assert(!f.blocked_dates->Find("2030-12-24").has_value());

  bool not_found = false;
  try {
    f.blocked_dates->Unblock("2030-12-24");
  } catch (const reservation::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);

  bool invalid = false;
  try {
    f.blocked_dates->Block("2030-13-01", "typo");
  } catch (const reservation::util::ValidationError&) {
    invalid = true;
  }
  assert(invalid);
}

} // namespace

int main() {
  TestSlotsFollowConfiguredOrder();
  TestBlockedDateShortCircuits();
  TestSlotsForPartyFilterByRemaining();
  TestFullDayHasNoAvailability();
  TestInvalidArgumentsAreRejected();
  TestBlockedDateRegistry();

  std::cout << "reservation_engine_unit_daily_availability: pass\n";
  return 0;
}
