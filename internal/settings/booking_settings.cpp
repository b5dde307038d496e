#include "booking_settings.hpp"

#include <algorithm>
#include <set>

#include "internal/model/names.hpp"
#include "internal/util/errors.hpp"

namespace reservation::settings {

using namespace reservation::engine::v1;

namespace {

// Civil offsets in use range from UTC-12:00 to UTC+14:00.
constexpr int32_t kMaxUtcOffsetMinutes = 14 * 60;

} // namespace

BookingSettings::BookingSettings(reservation::engine::v1::BookingSettings proto) : proto_(std::move(proto)) {
  Validate(proto_);
  time_slots_.assign(proto_.time_slots().begin(), proto_.time_slots().end());
}

reservation::engine::v1::BookingSettings BookingSettings::Defaults() {
  reservation::engine::v1::BookingSettings proto;
  proto.set_indoor_capacity(40);
  proto.set_balcony_capacity(20);
  for (const char* slot : {"17:00", "17:30", "18:00", "18:30", "19:00", "19:30", "20:00", "20:30", "21:00"}) {
    proto.add_time_slots(slot);
  }
  proto.set_max_advance_booking_days(60);
  proto.set_cancellation_window_hours(24);
  proto.set_max_party_size(12);
  proto.set_utc_offset_minutes(0);
  return proto;
}

reservation::engine::v1::BookingSettings BookingSettings::Overlay(reservation::engine::v1::BookingSettings        base,
                                                                  const reservation::engine::v1::BookingSettings& overlay) {
  if (overlay.has_indoor_capacity()) base.set_indoor_capacity(overlay.indoor_capacity());
  if (overlay.has_balcony_capacity()) base.set_balcony_capacity(overlay.balcony_capacity());
  if (overlay.time_slots_size() > 0) *base.mutable_time_slots() = overlay.time_slots();
  if (overlay.has_max_advance_booking_days()) base.set_max_advance_booking_days(overlay.max_advance_booking_days());
  if (overlay.has_cancellation_window_hours()) base.set_cancellation_window_hours(overlay.cancellation_window_hours());
  if (overlay.has_max_party_size()) base.set_max_party_size(overlay.max_party_size());
  if (overlay.has_utc_offset_minutes()) base.set_utc_offset_minutes(overlay.utc_offset_minutes());
  return base;
}

void BookingSettings::Validate(const reservation::engine::v1::BookingSettings& proto) {
  if (proto.time_slots().empty()) {
    throw util::ValidationError("at least one time slot must be configured");
  }

  std::set<std::string> seen;
  for (const auto& slot : proto.time_slots()) {
    if (!util::ParseSlotTime(slot)) {
      throw util::ValidationError("invalid time slot label: " + slot);
    }
    if (!seen.insert(slot).second) {
      throw util::ValidationError("duplicate time slot label: " + slot);
    }
  }

  if (proto.utc_offset_minutes() < -kMaxUtcOffsetMinutes || proto.utc_offset_minutes() > kMaxUtcOffsetMinutes) {
    throw util::ValidationError("utc_offset_minutes out of range: " + std::to_string(proto.utc_offset_minutes()));
  }
}

uint32_t BookingSettings::Capacity(SeatingType seating) const {
  switch (seating) {
    case SEATING_TYPE_INDOOR:
      return proto_.indoor_capacity();
    case SEATING_TYPE_BALCONY:
      return proto_.balcony_capacity();
    default:
      throw util::ValidationError("unknown seating type: " + model::ToString(seating));
  }
}

bool BookingSettings::HasTimeSlot(std::string_view label) const {
  return std::find(time_slots_.begin(), time_slots_.end(), label) != time_slots_.end();
}

bool BookingSettings::IsDateWithinBookingWindow(const util::Date& date, const util::Date& today) const {
  const auto days = util::DaysBetween(today, date);
  return days >= 0 && days <= static_cast<int64_t>(MaxAdvanceBookingDays());
}

util::Date BookingSettings::Today(util::TimePoint now) const {
  return util::LocalDate(now, UtcOffset());
}

} // namespace reservation::settings
