#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

#include "google/protobuf/timestamp.pb.h"

namespace reservation::util {

/*
  Time utilities: single place to control clock source.

  Calendar dates are civil dates without a time-of-day. They are keyed by
  their canonical "YYYY-MM-DD" form so that no timezone conversion ever
  touches them. Slot labels are "HH:MM" minutes past local midnight.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Date      = std::chrono::year_month_day;

// Injectable clock; production code binds it to Now().
using NowFn = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t  ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(uint64_t ms);

std::optional<Date> ParseDateKey(std::string_view text);
std::string         FormatDateKey(const Date& date);

std::optional<std::chrono::minutes> ParseSlotTime(std::string_view label);

// Instant at which the slot starts, given the venue offset from UTC.
TimePoint SlotStart(const Date& date, std::chrono::minutes time_of_day, std::chrono::minutes utc_offset);

// Civil date of an instant as seen at the venue.
Date LocalDate(TimePoint tp, std::chrono::minutes utc_offset);

// Whole days from `from` to `to` (negative when `to` is earlier).
int64_t DaysBetween(const Date& from, const Date& to);

} // namespace reservation::util
