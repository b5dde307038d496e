#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/blocked_date_registry.hpp"
#include "internal/core/slot_reservation.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/settings/settings_provider.hpp"
#include "internal/util/time.hpp"
#include "reservation/engine/v1.hpp"

namespace reservation::core {

struct DailyStats {
  std::string date;
  uint32_t    reservations = 0;
  uint32_t    guests       = 0;
};

/*
  Owns reservations after creation: status transitions, cancellation
  window, reads, listing and deletion.

  Creation validates the request and delegates the capacity-checked
  insert to SlotReservation. Status writes are single-record
  transactions; a conflicting concurrent write to the same record
  restarts the unit under the same RetryPolicy.
*/
class ReservationLifecycle {
 public:
  ReservationLifecycle(std::shared_ptr<reservation::db::Repository>             repository,
                       std::shared_ptr<reservation::settings::SettingsProvider> settings,
                       std::shared_ptr<SlotReservation> slots, std::shared_ptr<BlockedDateRegistry> blocked_dates,
                       reservation::util::NowFn now);

  reservation::engine::v1::Reservation Create(const reservation::engine::v1::CreateReservationRequest& request);

  reservation::engine::v1::Reservation Get(const std::string& id) const;

  reservation::engine::v1::Reservation Cancel(const std::string& id, const std::optional<std::string>& reason);

  reservation::engine::v1::Reservation UpdateStatus(const std::string& id, reservation::engine::v1::ReservationStatus status,
                                                    const std::optional<std::string>& reason);

  reservation::engine::v1::ListReservationsResponse List(const reservation::engine::v1::ListReservationsRequest& request) const;

  void Delete(const std::string& id);

  // Confirmed or seated reservations dated today, by time ascending.
  std::vector<reservation::engine::v1::Reservation> TodayReservations() const;

  // Occupying reservations of the date; empty date = today.
  DailyStats Stats(const std::string& date) const;

  std::string TodayKey() const;

 private:
  using Mutation = std::function<void(reservation::db::model::ReservationRecord&)>;

  // Read-modify-write of one record with conflict retry.
  reservation::engine::v1::Reservation Mutate(const std::string& id, const Mutation& mutate);

  static void ApplyTransition(reservation::db::model::ReservationRecord& record, reservation::engine::v1::ReservationStatus to,
                              const std::optional<std::string>& reason, uint64_t now_ms);

  std::shared_ptr<reservation::db::Repository>             repository_;
  std::shared_ptr<reservation::settings::SettingsProvider> settings_;
  std::shared_ptr<SlotReservation>                         slots_;
  std::shared_ptr<BlockedDateRegistry>                     blocked_dates_;
  reservation::util::NowFn                                 now_;
};

reservation::engine::v1::Reservation ToReservation(const reservation::db::model::ReservationRecord& record);

} // namespace reservation::core
