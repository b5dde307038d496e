#include "time.hpp"

#include <charconv>
#include <cstdio>

namespace reservation::util {

namespace {

bool ParseFixedDigits(std::string_view text, int& out) {
  if (text.empty()) return false;
  const auto* begin = text.data();
  const auto* end   = text.data() + text.size();
  auto [ptr, ec]    = std::from_chars(begin, end, out);
  return ec == std::errc() && ptr == end;
}

} // namespace

TimePoint Now() {
  return Clock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);
  if (nanos.count() < 0) {
    sec -= std::chrono::seconds(1);
    nanos += std::chrono::seconds(1);
  }

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

TimePoint FromProto(const google::protobuf::Timestamp& ts) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::seconds(ts.seconds()) + std::chrono::nanoseconds(ts.nanos()));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint FromUnixMillis(uint64_t ms) {
  return TimePoint{} + std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(ms));
}

std::optional<Date> ParseDateKey(std::string_view text) {
  // YYYY-MM-DD
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }

  int year  = 0;
  int month = 0;
  int day   = 0;
  if (!ParseFixedDigits(text.substr(0, 4), year) || !ParseFixedDigits(text.substr(5, 2), month) ||
      !ParseFixedDigits(text.substr(8, 2), day)) {
    return std::nullopt;
  }

  const Date date{std::chrono::year{year}, std::chrono::month{static_cast<unsigned>(month)}, std::chrono::day{static_cast<unsigned>(day)}};
  if (!date.ok()) {
    return std::nullopt;
  }
  return date;
}

std::string FormatDateKey(const Date& date) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(date.year()), static_cast<unsigned>(date.month()),
                static_cast<unsigned>(date.day()));
  return buf;
}

std::optional<std::chrono::minutes> ParseSlotTime(std::string_view label) {
  // HH:MM
  if (label.size() != 5 || label[2] != ':') {
    return std::nullopt;
  }

  int hours   = 0;
  int minutes = 0;
  if (!ParseFixedDigits(label.substr(0, 2), hours) || !ParseFixedDigits(label.substr(3, 2), minutes)) {
    return std::nullopt;
  }
  if (hours < 0 || hours > 23 || minutes < 0 || minutes > 59) {
    return std::nullopt;
  }
  return std::chrono::hours(hours) + std::chrono::minutes(minutes);
}

TimePoint SlotStart(const Date& date, std::chrono::minutes time_of_day, std::chrono::minutes utc_offset) {
  const std::chrono::sys_days day{date};
  return std::chrono::time_point_cast<Clock::duration>(day + time_of_day - utc_offset);
}

Date LocalDate(TimePoint tp, std::chrono::minutes utc_offset) {
  return Date{std::chrono::floor<std::chrono::days>(tp + utc_offset)};
}

int64_t DaysBetween(const Date& from, const Date& to) {
  return (std::chrono::sys_days{to} - std::chrono::sys_days{from}).count();
}

} // namespace reservation::util
