#include "names.hpp"

namespace reservation::model {

using namespace reservation::engine::v1;

std::string ToString(SeatingType seating) {
  switch (seating) {
    case SEATING_TYPE_INDOOR:
      return "indoor";
    case SEATING_TYPE_BALCONY:
      return "balcony";
    default:
      return "unspecified";
  }
}

std::string ToString(ReservationStatus status) {
  switch (status) {
    case RESERVATION_STATUS_PENDING:
      return "pending";
    case RESERVATION_STATUS_CONFIRMED:
      return "confirmed";
    case RESERVATION_STATUS_SEATED:
      return "seated";
    case RESERVATION_STATUS_COMPLETED:
      return "completed";
    case RESERVATION_STATUS_CANCELLED:
      return "cancelled";
    case RESERVATION_STATUS_NO_SHOW:
      return "no-show";
    default:
      return "unspecified";
  }
}

std::optional<SeatingType> ParseSeatingType(std::string_view name) {
  if (name == "indoor") return SEATING_TYPE_INDOOR;
  if (name == "balcony") return SEATING_TYPE_BALCONY;
  return std::nullopt;
}

std::optional<ReservationStatus> ParseStatus(std::string_view name) {
  if (name == "pending") return RESERVATION_STATUS_PENDING;
  if (name == "confirmed") return RESERVATION_STATUS_CONFIRMED;
  if (name == "seated") return RESERVATION_STATUS_SEATED;
  if (name == "completed") return RESERVATION_STATUS_COMPLETED;
  if (name == "cancelled") return RESERVATION_STATUS_CANCELLED;
  if (name == "no-show") return RESERVATION_STATUS_NO_SHOW;
  return std::nullopt;
}

} // namespace reservation::model
