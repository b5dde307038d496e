#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "internal/bootstrap.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/availability_service.hpp"
#include "internal/service/reservation_service.hpp"
#include "internal/settings/booking_settings.hpp"
#include "internal/util/errors.hpp"

namespace {

using namespace std::chrono;
using namespace reservation::engine::v1;

// 2030-06-01T12:00:00Z
const reservation::util::TimePoint kNow = sys_days{year{2030} / 6 / 1} + hours(12);

reservation::runtime::config::RuntimeConfig MakeConfig() {
  reservation::runtime::config::RuntimeConfig config;
  *config.mutable_booking() = reservation::settings::BookingSettings::Defaults();
  config.mutable_booking()->set_indoor_capacity(6);
  config.mutable_booking()->set_balcony_capacity(4);
  config.mutable_booking()->clear_time_slots();
  config.mutable_booking()->add_time_slots("18:00");
  config.mutable_booking()->add_time_slots("19:00");

  auto* seed = config.add_blocked_dates();
  seed->set_date("2030-06-15");
  seed->set_reason("Staff party");
  return config;
}

reservation::service::ServiceContext MakeContext() {
  return reservation::bootstrap::BuildServiceContext(MakeConfig(), std::make_shared<reservation::db::memory::MemoryRepository>(),
                                                     [] { return kNow; });
}

CreateReservationRequest Request(const std::string& date, const std::string& time, SeatingType seating, uint32_t party_size) {
  CreateReservationRequest req;
  req.set_guest_name("Grace Hopper");
  req.set_email("grace@example.com");
  req.set_phone("555 0100 200");
  req.set_party_size(party_size);
  req.set_date(date);
  req.set_time(time);
  req.set_seating_type(seating);
  return req;
}

void TestBuildRepositoryDefaultsToMemory() {
  reservation::runtime::config::RuntimeConfig empty;
  auto repository = reservation::bootstrap::BuildRepository(empty);
  assert(repository);
  assert(std::dynamic_pointer_cast<reservation::db::memory::MemoryRepository>(repository) != nullptr);
}

void TestSeededAndManualBlockedDates() {
  auto                              ctx = MakeContext();
  reservation::service::AdminService admin(ctx);

  auto listed = admin.ListBlockedDates(ListBlockedDatesRequest{});
  assert(listed.blocked_dates_size() == 1);
  assert(listed.blocked_dates(0).date() == "2030-06-15");
  assert(listed.blocked_dates(0).reason() == "Staff party");

  BlockDateRequest block;
  block.set_date("2030-06-10");
  block.set_reason("Kitchen refit");
  auto blocked = admin.BlockDate(block);
  assert(blocked.blocked_date().date() == "2030-06-10");
  assert(reservation::util::FromProto(blocked.blocked_date().created_at()) == kNow);

  listed = admin.ListBlockedDates(ListBlockedDatesRequest{});
  assert(listed.blocked_dates_size() == 2);
  assert(listed.blocked_dates(0).date() == "2030-06-10");
  assert(listed.blocked_dates(1).date() == "2030-06-15");

  UnblockDateRequest unblock;
  unblock.set_date("2030-06-10");
  admin.UnblockDate(unblock);

  bool threw = false;
  try {
    admin.UnblockDate(unblock);
  } catch (const reservation::util::NotFound& ex) {
    threw = std::string(ex.what()) == "date is not blocked: 2030-06-10";
  }
  assert(threw);

  BlockDateRequest bad;
  bad.set_date("2030-13-01");
  threw = false;
  try {
    admin.BlockDate(bad);
  } catch (const reservation::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
}

void TestBlockedDateClosesAvailability() {
  auto                                     ctx = MakeContext();
  reservation::service::AvailabilityService availability(ctx);

  DailyAvailabilityRequest daily;
  daily.set_date("2030-06-15");
  auto blocked = availability.GetDailyAvailability(daily);
  assert(blocked.availability().is_blocked());
  assert(blocked.availability().notes() == "Staff party");
  assert(blocked.availability().time_slots_size() == 0);

  HasAvailabilityRequest has;
  has.set_date("2030-06-15");
  assert(!availability.HasAvailability(has).available());

  has.set_date("2030-06-16");
  assert(availability.HasAvailability(has).available());
}

void TestServicesShareOneView() {
  auto                                     ctx = MakeContext();
  reservation::service::ReservationService  reservations(ctx);
  reservation::service::AvailabilityService availability(ctx);
  reservation::service::AdminService        admin(ctx);

  auto created = reservations.Create(Request("2030-06-01", "19:00", SEATING_TYPE_BALCONY, 3)).reservation();
  reservations.Create(Request("2030-06-01", "18:00", SEATING_TYPE_INDOOR, 6));

  SlotAvailabilityRequest slot;
  slot.set_date("2030-06-01");
  slot.set_time("19:00");
  slot.set_seating_type(SEATING_TYPE_BALCONY);
  slot.set_party_size(2);
  auto slot_resp = availability.GetSlotAvailability(slot);
  assert(slot_resp.availability().remaining_capacity() == 1);
  assert(!slot_resp.can_accommodate());

  AvailableSlotsRequest slots;
  slots.set_date("2030-06-01");
  slots.set_party_size(2);
  slots.set_preferred_seating_type(SEATING_TYPE_BALCONY);
  auto open = availability.ListAvailableSlots(slots);
  assert(open.preferred_seating_type() == SEATING_TYPE_BALCONY);
  assert(open.indoor_size() == 1);
  assert(open.indoor(0) == "19:00");
  assert(open.balcony_size() == 1);
  assert(open.balcony(0) == "18:00");

  auto today = admin.TodayReservations(TodayReservationsRequest{});
  assert(today.date() == "2030-06-01");
  assert(today.reservations_size() == 2);
  assert(today.reservations(0).time() == "18:00");

  auto stats = admin.DailyStats(DailyStatsRequest{});
  assert(stats.date() == "2030-06-01");
  assert(stats.reservations() == 2);
  assert(stats.guests() == 9);

  UpdateReservationStatusRequest no_show;
  no_show.set_id(created.id());
  no_show.set_status(RESERVATION_STATUS_NO_SHOW);
  assert(reservations.UpdateStatus(no_show).reservation().status() == RESERVATION_STATUS_NO_SHOW);

  stats = admin.DailyStats(DailyStatsRequest{});
  assert(stats.reservations() == 1);
  assert(stats.guests() == 6);

  DeleteReservationRequest del;
  del.set_id(created.id());
  reservations.Delete(del);

  GetReservationRequest get;
  get.set_id(created.id());
  bool threw = false;
  try {
    reservations.Get(get);
  } catch (const reservation::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestSettingsUpdateTakesEffect() {
  auto                                     ctx = MakeContext();
  reservation::service::AdminService        admin(ctx);
  reservation::service::AvailabilityService availability(ctx);

  auto current = admin.GetSettings(GetSettingsRequest{}).settings();
  assert(current.indoor_capacity() == 6);
  assert(current.time_slots_size() == 2);

  UpdateSettingsRequest update;
  *update.mutable_settings() = current;
  update.mutable_settings()->set_indoor_capacity(30);
  update.mutable_settings()->add_time_slots("20:00");
  auto updated = admin.UpdateSettings(update).settings();
  assert(updated.indoor_capacity() == 30);
  assert(updated.time_slots_size() == 3);

  DailyAvailabilityRequest daily;
  daily.set_date("2030-06-02");
  auto day = availability.GetDailyAvailability(daily).availability();
  assert(day.time_slots_size() == 3);
  assert(day.time_slots(2).time() == "20:00");
  assert(day.time_slots(0).available_indoor() == 30);

  UpdateSettingsRequest invalid;
  *invalid.mutable_settings() = updated;
  invalid.mutable_settings()->add_time_slots("19:00");
  bool threw = false;
  try {
    admin.UpdateSettings(invalid);
  } catch (const reservation::util::ValidationError&) {
    threw = true;
  }
  assert(threw);
  assert(admin.GetSettings(GetSettingsRequest{}).settings().time_slots_size() == 3);
}

} // namespace

int main() {
  TestBuildRepositoryDefaultsToMemory();
  TestSeededAndManualBlockedDates();
  TestBlockedDateClosesAvailability();
  TestServicesShareOneView();
  TestSettingsUpdateTakesEffect();

  std::cout << "reservation_engine_unit_admin_service: pass\n";
  return 0;
}
