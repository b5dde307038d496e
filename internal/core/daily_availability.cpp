#include "daily_availability.hpp"

#include <future>
#include <utility>

#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace reservation::core {

using namespace reservation::engine::v1;

DailyAvailabilityAggregator::DailyAvailabilityAggregator(std::shared_ptr<AvailabilityCalculator>                  calculator,
                                                         std::shared_ptr<BlockedDateRegistry>                     blocked_dates,
                                                         std::shared_ptr<reservation::settings::SettingsProvider> settings)
    : calculator_(std::move(calculator)), blocked_dates_(std::move(blocked_dates)), settings_(std::move(settings)) {
}

std::vector<DailyAvailabilityAggregator::SlotRemaining> DailyAvailabilityAggregator::ComputeSlots(
    const std::string& date, std::optional<BlockedDate>* blocked) const {
  if (!reservation::util::ParseDateKey(date)) {
    throw reservation::util::ValidationError("invalid date: " + date);
  }

  *blocked = blocked_dates_->Find(date);
  if (*blocked) {
    return {};
  }

  const auto settings = settings_->Snapshot();

  using Pending = std::pair<std::future<AvailabilityResult>, std::future<AvailabilityResult>>;
  std::vector<Pending> pending;
  pending.reserve(settings->TimeSlots().size());
  for (const auto& time : settings->TimeSlots()) {
    auto indoor = std::async(std::launch::async, [this, settings, date, time] {
      return calculator_->ComputeSlotAvailability(*settings, date, time, SEATING_TYPE_INDOOR);
    });
    auto balcony = std::async(std::launch::async, [this, settings, date, time] {
      return calculator_->ComputeSlotAvailability(*settings, date, time, SEATING_TYPE_BALCONY);
    });
    pending.emplace_back(std::move(indoor), std::move(balcony));
  }

  std::vector<SlotRemaining> out;
  out.reserve(pending.size());
  for (std::size_t i = 0; i < pending.size(); ++i) {
    SlotRemaining slot;
    slot.time    = settings->TimeSlots()[i];
    slot.indoor  = pending[i].first.get().remaining_capacity();
    slot.balcony = pending[i].second.get().remaining_capacity();
    out.push_back(std::move(slot));
  }
  return out;
}

DailyAvailability DailyAvailabilityAggregator::GetDailyAvailability(const std::string& date) const {
  std::optional<BlockedDate> blocked;
  const auto                 slots = ComputeSlots(date, &blocked);

  DailyAvailability out;
  out.set_date(date);
  if (blocked) {
    out.set_is_blocked(true);
    out.set_notes(blocked->reason());
    return out;
  }

  for (const auto& slot : slots) {
    auto* time_slot = out.add_time_slots();
    time_slot->set_time(slot.time);
    time_slot->set_available_indoor(slot.indoor);
    time_slot->set_available_balcony(slot.balcony);
    time_slot->set_is_available(slot.indoor > 0 || slot.balcony > 0);
  }
  return out;
}

AvailableSlots DailyAvailabilityAggregator::ListAvailableSlotsForParty(const std::string& date, uint32_t party_size,
                                                                       SeatingType preferred) const {
  if (party_size == 0) {
    throw reservation::util::ValidationError("party size must be at least 1");
  }

  std::optional<BlockedDate> blocked;
  const auto                 slots = ComputeSlots(date, &blocked);

  AvailableSlots out;
  out.preferred = preferred;
  for (const auto& slot : slots) {
    if (slot.indoor >= party_size) {
      out.indoor.push_back(slot.time);
    }
    if (slot.balcony >= party_size) {
      out.balcony.push_back(slot.time);
    }
  }
  return out;
}

bool DailyAvailabilityAggregator::HasAnyAvailability(const std::string& date) const {
  std::optional<BlockedDate> blocked;
  for (const auto& slot : ComputeSlots(date, &blocked)) {
    if (slot.indoor > 0 || slot.balcony > 0) {
      return true;
    }
  }
  return false;
}

} // namespace reservation::core
