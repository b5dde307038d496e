#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/availability_calculator.hpp"
#include "internal/core/blocked_date_registry.hpp"
#include "internal/settings/settings_provider.hpp"
#include "reservation/engine/v1.hpp"

namespace reservation::core {

struct AvailableSlots {
  std::vector<std::string> indoor;
  std::vector<std::string> balcony;

  reservation::engine::v1::SeatingType preferred = reservation::engine::v1::SEATING_TYPE_UNSPECIFIED;
};

/*
  Per-date view over every configured slot.

  Blocked dates short-circuit before any capacity is computed. The
  per-slot computations are independent and run concurrently; results
  are assembled in configured slot order.
*/
class DailyAvailabilityAggregator {
 public:
  DailyAvailabilityAggregator(std::shared_ptr<AvailabilityCalculator>                  calculator,
                              std::shared_ptr<BlockedDateRegistry>                     blocked_dates,
                              std::shared_ptr<reservation::settings::SettingsProvider> settings);

  reservation::engine::v1::DailyAvailability GetDailyAvailability(const std::string& date) const;

  // The preference is echoed back and never filters.
  AvailableSlots ListAvailableSlotsForParty(const std::string& date, uint32_t party_size,
                                            reservation::engine::v1::SeatingType preferred) const;

  bool HasAnyAvailability(const std::string& date) const;

 private:
  struct SlotRemaining {
    std::string time;
    uint32_t    indoor  = 0;
    uint32_t    balcony = 0;
  };

  // Empty when the date is blocked; `blocked` receives the block if any.
  std::vector<SlotRemaining> ComputeSlots(const std::string& date,
                                          std::optional<reservation::engine::v1::BlockedDate>* blocked) const;

  std::shared_ptr<AvailabilityCalculator>                  calculator_;
  std::shared_ptr<BlockedDateRegistry>                     blocked_dates_;
  std::shared_ptr<reservation::settings::SettingsProvider> settings_;
};

} // namespace reservation::core
