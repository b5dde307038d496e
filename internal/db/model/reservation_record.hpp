#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "reservation/engine/v1.hpp"

namespace reservation::db::model {

/*
  Persistent reservation row.

  IMPORTANT:
  - date is the canonical "YYYY-MM-DD" key, time the slot label.
  - (date, time, seating_type) is the SlotKey the row occupies while its
    status is pending, confirmed or seated.
*/

struct ReservationRecord {
  std::string id;

  std::string guest_name;
  std::string email;
  std::string phone;

  uint32_t    party_size = 0;
  std::string date;
  std::string time;

  reservation::engine::v1::SeatingType seating_type =
      reservation::engine::v1::SEATING_TYPE_UNSPECIFIED;

  reservation::engine::v1::ReservationStatus status =
      reservation::engine::v1::RESERVATION_STATUS_UNSPECIFIED;

  std::optional<std::string> special_requests;

  uint64_t                   created_at_ms = 0;
  uint64_t                   updated_at_ms = 0;
  std::optional<uint64_t>    cancelled_at_ms;
  std::optional<std::string> cancellation_reason;
};

}
