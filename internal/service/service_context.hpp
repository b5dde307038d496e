#pragma once

#include <memory>

namespace reservation::core {
class ReservationLifecycle;
class AvailabilityCalculator;
class DailyAvailabilityAggregator;
class BlockedDateRegistry;
}
namespace reservation::settings { class SettingsProvider; }

namespace reservation::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<reservation::core::ReservationLifecycle> lifecycle;
  std::shared_ptr<reservation::core::AvailabilityCalculator> calculator;
  std::shared_ptr<reservation::core::DailyAvailabilityAggregator> daily;
  std::shared_ptr<reservation::core::BlockedDateRegistry> blocked_dates;
  std::shared_ptr<reservation::settings::SettingsProvider> settings;
};

}
