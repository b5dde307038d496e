#include "availability_calculator.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace reservation::core {

using namespace reservation::engine::v1;

AvailabilityCalculator::AvailabilityCalculator(std::shared_ptr<reservation::db::Repository>             repository,
                                               std::shared_ptr<reservation::settings::SettingsProvider> settings)
    : repository_(std::move(repository)), settings_(std::move(settings)) {
}

AvailabilityResult AvailabilityCalculator::MakeResult(uint32_t total_capacity, uint64_t booked_count) {
  const int64_t remaining = static_cast<int64_t>(total_capacity) - static_cast<int64_t>(booked_count);

  AvailabilityResult result;
  result.set_total_capacity(total_capacity);
  result.set_booked_count(static_cast<uint32_t>(booked_count));
  result.set_remaining_capacity(static_cast<uint32_t>(std::max<int64_t>(0, remaining)));
  result.set_available(result.remaining_capacity() > 0);
  return result;
}

AvailabilityResult AvailabilityCalculator::ComputeSlotAvailability(const std::string& date, const std::string& time,
                                                                   SeatingType seating) const {
  return ComputeSlotAvailability(*settings_->Snapshot(), date, time, seating);
}

AvailabilityResult AvailabilityCalculator::ComputeSlotAvailability(const reservation::settings::BookingSettings& settings,
                                                                   const std::string& date, const std::string& time,
                                                                   SeatingType seating) const {
  if (!reservation::util::ParseDateKey(date)) {
    throw reservation::util::ValidationError("invalid date: " + date);
  }
  if (!settings.HasTimeSlot(time)) {
    throw reservation::util::ValidationError("unknown time slot: " + time);
  }
  const auto total = settings.Capacity(seating);

  auto       tx     = repository_->Begin();
  const auto booked = repository_->SumOccupyingPartySize(*tx, date, time, seating);
  tx->Commit();

  return MakeResult(total, booked);
}

bool AvailabilityCalculator::CanAccommodate(const std::string& date, const std::string& time, SeatingType seating,
                                            uint32_t party_size) const {
  return ComputeSlotAvailability(date, time, seating).remaining_capacity() >= party_size;
}

} // namespace reservation::core
