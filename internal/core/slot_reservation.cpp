#include "slot_reservation.hpp"

#include <algorithm>
#include <thread>

#include "internal/core/db_error.hpp"
#include "internal/model/names.hpp"
#include "internal/model/slot_key.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace reservation::core {

using namespace reservation::engine::v1;

SlotReservation::SlotReservation(std::shared_ptr<reservation::db::Repository> repository, RetryPolicy policy,
                                 reservation::util::NowFn now)
    : repository_(std::move(repository)), policy_(policy), now_(std::move(now)) {
  if (policy_.max_attempts == 0) {
    policy_.max_attempts = 1;
  }
}

std::string SlotReservation::ReserveSlot(const reservation::settings::BookingSettings& settings,
                                         reservation::db::model::ReservationRecord reservation) {
  const reservation::model::SlotKey key{reservation.date, reservation.time, reservation.seating_type};
  const auto                        slot_key = key.ToString();
  const auto                        seating  = reservation::model::ToString(key.seating);
  const auto                        capacity = settings.Capacity(key.seating);

  reservation::observability::SpanScope span("SlotReservation.ReserveSlot");
  span.SetSlot(key);
  span.SetAttribute("party_size", static_cast<std::int64_t>(reservation.party_size));

  if (reservation.id.empty()) {
    reservation.id = reservation::util::NewId();
  }
  span.SetReservationId(reservation.id);
  reservation.status = RESERVATION_STATUS_CONFIRMED;

  for (uint32_t attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
    try {
      auto tx   = repository_->Begin();
      auto lock = repository_->ReadSlotLock(*tx, slot_key);

      const auto    booked    = repository_->SumOccupyingPartySize(*tx, key.date, key.time, key.seating);
      const int64_t remaining = static_cast<int64_t>(capacity) - static_cast<int64_t>(booked);
      if (remaining < static_cast<int64_t>(reservation.party_size)) {
        const auto reported = static_cast<uint32_t>(std::max<int64_t>(0, remaining));
        reservation::observability::Metrics::Instance().RecordCapacityRejection(seating);
        RESERVATION_LOG_INFO("slot capacity exhausted", {observability::SlotKeyField(key),
                                                         observability::IntField("party_size", reservation.party_size),
                                                         observability::IntField("remaining", reported)});
        throw reservation::util::CapacityExhausted("Only " + std::to_string(reported) + " " + seating +
                                                       " seats available for " + key.date + " " + key.time,
                                                   reported);
      }

      const auto now_ms         = reservation::util::ToUnixMillis(now_());
      reservation.created_at_ms = now_ms;
      reservation.updated_at_ms = now_ms;
      ThrowIfDbError(repository_->InsertReservation(*tx, reservation), "insert reservation");

      lock.last_reservation_id    = reservation.id;
      lock.last_reservation_at_ms = now_ms;
      ThrowIfDbError(repository_->UpsertSlotLock(*tx, lock), "update slot lock");

      tx->Commit();

      RESERVATION_LOG_INFO("reservation committed", {observability::ReservationIdField(reservation.id),
                                                     observability::SlotKeyField(key),
                                                     observability::IntField("party_size", reservation.party_size),
                                                     observability::IntField("attempt", attempt)});
      return reservation.id;
    } catch (const reservation::db::SerializationFailure& e) {
      reservation::observability::Metrics::Instance().RecordCommitConflict(seating);
      span.AddEvent("commit_conflict");
      RESERVATION_LOG_WARN("slot commit conflict", {observability::SlotKeyField(key),
                                                    observability::IntField("attempt", attempt),
                                                    observability::StringField("error", e.what())});
    }

    if (attempt < policy_.max_attempts && policy_.backoff.count() > 0) {
      std::this_thread::sleep_for(policy_.backoff * attempt);
    }
  }

  span.RecordException("retry budget exhausted");
  throw reservation::util::TransientConflict("could not commit reservation for " + slot_key + " after " +
                                             std::to_string(policy_.max_attempts) + " attempts");
}

} // namespace reservation::core
