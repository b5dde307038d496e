#include "internal/settings/booking_settings.hpp"
#include "internal/settings/settings_provider.hpp"
#include "internal/util/errors.hpp"

#include <cassert>
#include <chrono>
#include <iostream>

namespace {

using namespace std::chrono;
using namespace reservation::engine::v1;
using reservation::settings::BookingSettings;

bool RejectsWithValidationError(const reservation::engine::v1::BookingSettings& proto) {
  try {
    BookingSettings settings(proto);
    (void)settings;
  } catch (const reservation::util::ValidationError&) {
    return true;
  }
  return false;
}

void TestDefaultsAreValid() {
  BookingSettings settings(BookingSettings::Defaults());
  assert(settings.Capacity(SEATING_TYPE_INDOOR) == 40);
  assert(settings.Capacity(SEATING_TYPE_BALCONY) == 20);
  assert(settings.TimeSlots().size() == 9);
  assert(settings.TimeSlots().front() == "17:00");
  assert(settings.TimeSlots().back() == "21:00");
  assert(settings.HasTimeSlot("19:30"));
  assert(!settings.HasTimeSlot("19:15"));
  assert(settings.MaxAdvanceBookingDays() == 60);
  assert(settings.CancellationWindowHours() == 24);
  assert(settings.MaxPartySize() == 12);
}

void TestValidationRejectsBadSlots() {
  auto no_slots = BookingSettings::Defaults();
  no_slots.clear_time_slots();
  assert(RejectsWithValidationError(no_slots));

  auto bad_label = BookingSettings::Defaults();
  bad_label.add_time_slots("7pm");
  assert(RejectsWithValidationError(bad_label));

  auto duplicate = BookingSettings::Defaults();
  duplicate.add_time_slots("18:00");
  assert(RejectsWithValidationError(duplicate));

  auto offset = BookingSettings::Defaults();
  offset.set_utc_offset_minutes(15 * 60);
  assert(RejectsWithValidationError(offset));
  offset.set_utc_offset_minutes(-12 * 60);
  assert(!RejectsWithValidationError(offset));
}

void TestCapacityRejectsUnknownSeating() {
  BookingSettings settings(BookingSettings::Defaults());
  bool            threw = false;
  try {
    settings.Capacity(SEATING_TYPE_UNSPECIFIED);
  } catch (const reservation::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestBookingWindowIsInclusive() {
  auto proto = BookingSettings::Defaults();
  proto.set_max_advance_booking_days(30);
  BookingSettings settings(proto);

  const year_month_day today = year{2030} / 6 / 1;
  assert(settings.IsDateWithinBookingWindow(today, today));
  assert(settings.IsDateWithinBookingWindow(year{2030} / 7 / 1, today));
  assert(!settings.IsDateWithinBookingWindow(year{2030} / 7 / 2, today));
  assert(!settings.IsDateWithinBookingWindow(year{2030} / 5 / 31, today));
}

void TestTodayUsesVenueOffset() {
  auto proto = BookingSettings::Defaults();
  proto.set_utc_offset_minutes(-300);
  BookingSettings settings(proto);

  // 03:00 UTC is still the previous evening five hours west.
  const auto now = sys_days{year{2030} / 6 / 2} + hours(3);
  assert(settings.Today(now) == (year{2030} / 6 / 1));
}

void TestProviderKeepsSnapshotOnInvalidUpdate() {
  reservation::settings::CachedSettingsProvider provider(BookingSettings::Defaults());
  const auto                                   before = provider.Snapshot();

  auto invalid = BookingSettings::Defaults();
  invalid.clear_time_slots();
  bool threw = false;
  try {
    provider.Update(invalid);
  } catch (const reservation::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(provider.Snapshot() == before);

  auto bigger = BookingSettings::Defaults();
  bigger.set_indoor_capacity(80);
  const auto after = provider.Update(bigger);
  assert(after->Capacity(SEATING_TYPE_INDOOR) == 80);
  assert(provider.Snapshot() == after);
  // Holders of the old snapshot keep a consistent view.
  assert(before->Capacity(SEATING_TYPE_INDOOR) == 40);
}

} // namespace

int main() {
  TestDefaultsAreValid();
  TestValidationRejectsBadSlots();
  TestCapacityRejectsUnknownSeating();
  TestBookingWindowIsInclusive();
  TestTodayUsesVenueOffset();
  TestProviderKeepsSnapshotOnInvalidUpdate();

  std::cout << "reservation_engine_unit_booking_settings: pass\n";
  return 0;
}
