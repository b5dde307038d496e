#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/settings/booking_settings.hpp"
#include "internal/settings/settings_provider.hpp"
#include "reservation/engine/v1.hpp"

namespace reservation::core {

/*
  Remaining capacity of one (date, time, seating) slot.

  Read-only: the result is recomputed from occupying reservations on
  every call and may be momentarily stale under concurrent commits.
*/
class AvailabilityCalculator {
 public:
  AvailabilityCalculator(std::shared_ptr<reservation::db::Repository>             repository,
                         std::shared_ptr<reservation::settings::SettingsProvider> settings);

  reservation::engine::v1::AvailabilityResult ComputeSlotAvailability(const std::string& date, const std::string& time,
                                                                      reservation::engine::v1::SeatingType seating) const;

  // Same as above against an explicit snapshot.
  reservation::engine::v1::AvailabilityResult ComputeSlotAvailability(const reservation::settings::BookingSettings& settings,
                                                                      const std::string& date, const std::string& time,
                                                                      reservation::engine::v1::SeatingType seating) const;

  bool CanAccommodate(const std::string& date, const std::string& time, reservation::engine::v1::SeatingType seating,
                      uint32_t party_size) const;

  static reservation::engine::v1::AvailabilityResult MakeResult(uint32_t total_capacity, uint64_t booked_count);

 private:
  std::shared_ptr<reservation::db::Repository>             repository_;
  std::shared_ptr<reservation::settings::SettingsProvider> settings_;
};

} // namespace reservation::core
