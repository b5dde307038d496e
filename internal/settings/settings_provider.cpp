#include "settings_provider.hpp"

#include <mutex>

#include "internal/observability/logging.hpp"

namespace reservation::settings {

CachedSettingsProvider::CachedSettingsProvider(const reservation::engine::v1::BookingSettings& initial)
    : current_(std::make_shared<const BookingSettings>(initial)) {
}

std::shared_ptr<const BookingSettings> CachedSettingsProvider::Snapshot() const {
  std::shared_lock lock(mutex_);
  return current_;
}

std::shared_ptr<const BookingSettings> CachedSettingsProvider::Update(const reservation::engine::v1::BookingSettings& proto) {
  auto next = std::make_shared<const BookingSettings>(proto);
  {
    std::unique_lock lock(mutex_);
    current_ = next;
  }

  RESERVATION_LOG_INFO("booking settings updated",
                       {observability::IntField("indoor_capacity", next->Capacity(reservation::engine::v1::SEATING_TYPE_INDOOR)),
                        observability::IntField("balcony_capacity", next->Capacity(reservation::engine::v1::SEATING_TYPE_BALCONY)),
                        observability::IntField("time_slots", static_cast<std::int64_t>(next->TimeSlots().size()))});
  return next;
}

} // namespace reservation::settings
