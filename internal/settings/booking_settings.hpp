#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "internal/util/time.hpp"
#include "reservation/engine/v1.hpp"

namespace reservation::settings {

/*
  Immutable view over the booking parameters.

  An instance is one consistent snapshot: every operation reads exactly
  one and never observes a concurrent settings update halfway through.
*/
class BookingSettings {
 public:
  // Throws util::ValidationError.
  explicit BookingSettings(reservation::engine::v1::BookingSettings proto);

  static reservation::engine::v1::BookingSettings Defaults();

  // `base` with every field present in `overlay` replaced; a non-empty
  // overlay slot list replaces the whole list.
  static reservation::engine::v1::BookingSettings Overlay(reservation::engine::v1::BookingSettings        base,
                                                          const reservation::engine::v1::BookingSettings& overlay);

  // Capacities are non-negative by type; slot labels must be unique "HH:MM".
  static void Validate(const reservation::engine::v1::BookingSettings& proto);

  // Total seats per slot for the category; unknown category -> ValidationError.
  uint32_t Capacity(reservation::engine::v1::SeatingType seating) const;

  const std::vector<std::string>& TimeSlots() const {
    return time_slots_;
  }
  bool HasTimeSlot(std::string_view label) const;

  uint32_t MaxAdvanceBookingDays() const {
    return proto_.max_advance_booking_days();
  }
  uint32_t CancellationWindowHours() const {
    return proto_.cancellation_window_hours();
  }
  // 0 = no maximum.
  uint32_t MaxPartySize() const {
    return proto_.max_party_size();
  }
  std::chrono::minutes UtcOffset() const {
    return std::chrono::minutes(proto_.utc_offset_minutes());
  }

  // today <= date <= today + MaxAdvanceBookingDays()
  bool IsDateWithinBookingWindow(const util::Date& date, const util::Date& today) const;

  // Venue-local calendar date of an instant.
  util::Date Today(util::TimePoint now) const;

  const reservation::engine::v1::BookingSettings& Proto() const {
    return proto_;
  }

 private:
  reservation::engine::v1::BookingSettings proto_;
  std::vector<std::string>                 time_slots_;
};

} // namespace reservation::settings
