#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "reservation/engine/v1.hpp"

namespace reservation::model {

// Wire-facing names: "indoor", "balcony", "pending", ..., "no-show".
std::string ToString(reservation::engine::v1::SeatingType seating);
std::string ToString(reservation::engine::v1::ReservationStatus status);

std::optional<reservation::engine::v1::SeatingType>       ParseSeatingType(std::string_view name);
std::optional<reservation::engine::v1::ReservationStatus> ParseStatus(std::string_view name);

} // namespace reservation::model
