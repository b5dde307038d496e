#pragma once

#include <memory>
#include <shared_mutex>

#include "internal/settings/booking_settings.hpp"

namespace reservation::settings {

/*
  Source of the current booking settings snapshot.

  Read-mostly: callers take one Snapshot() per operation and use only
  that snapshot for the rest of the operation.
*/
class SettingsProvider {
 public:
  virtual ~SettingsProvider() = default;

  virtual std::shared_ptr<const BookingSettings> Snapshot() const = 0;

  // Validates and atomically replaces the snapshot.
  virtual std::shared_ptr<const BookingSettings> Update(const reservation::engine::v1::BookingSettings& proto) = 0;
};

class CachedSettingsProvider final : public SettingsProvider {
 public:
  explicit CachedSettingsProvider(const reservation::engine::v1::BookingSettings& initial);

  std::shared_ptr<const BookingSettings> Snapshot() const override;
  std::shared_ptr<const BookingSettings> Update(const reservation::engine::v1::BookingSettings& proto) override;

 private:
  mutable std::shared_mutex              mutex_;
  std::shared_ptr<const BookingSettings> current_;
};

} // namespace reservation::settings
