#pragma once

#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "reservation/engine/v1.hpp"

namespace reservation::db {

struct Pagination {
  static constexpr std::size_t kUnbounded = static_cast<std::size_t>(std::numeric_limits<std::int64_t>::max());

  std::size_t limit  = 50;
  std::size_t offset = 0;
};

struct ReservationFilter {
  // Any of these statuses; empty = all.
  std::vector<reservation::engine::v1::ReservationStatus> statuses;

  std::optional<std::string>                          date;
  std::optional<std::string>                          email;
  std::optional<reservation::engine::v1::SeatingType> seating;
};

}  // namespace reservation::db
