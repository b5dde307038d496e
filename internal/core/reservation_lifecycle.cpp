#include "reservation_lifecycle.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>
#include <thread>
#include <tuple>

#include "internal/core/db_error.hpp"
#include "internal/model/names.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace reservation::core {

using namespace reservation::engine::v1;
using reservation::db::model::ReservationRecord;

namespace {

constexpr std::size_t kMaxNameLength = 100;
constexpr std::size_t kMinPhoneDigits = 7;
constexpr std::size_t kMaxPhoneDigits = 20;

std::string Trim(const std::string& s) {
  const auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
  const auto end   = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
  return begin < end ? std::string(begin, end) : std::string();
}

bool IsValidEmail(const std::string& email) {
  const auto at = email.find('@');
  if (at == std::string::npos || at == 0 || email.find('@', at + 1) != std::string::npos) {
    return false;
  }
  if (std::any_of(email.begin(), email.end(), [](unsigned char c) { return std::isspace(c); })) {
    return false;
  }
  const auto domain = email.substr(at + 1);
  const auto dot    = domain.find('.');
  return dot != std::string::npos && dot != 0 && domain.back() != '.';
}

bool IsValidPhone(const std::string& phone) {
  std::size_t digits = 0;
  for (unsigned char c : phone) {
    if (std::isdigit(c)) {
      ++digits;
    } else if (c != '+' && c != '-' && c != ' ' && c != '(' && c != ')' && c != '.') {
      return false;
    }
  }
  return digits >= kMinPhoneDigits && digits <= kMaxPhoneDigits;
}

reservation::util::Date RequireDate(const std::string& date) {
  auto parsed = reservation::util::ParseDateKey(date);
  if (!parsed) {
    throw reservation::util::ValidationError("invalid date: " + date);
  }
  return *parsed;
}

// The venue only sells indoor and balcony seats.
void RequireSeating(SeatingType seating) {
  if (seating != SEATING_TYPE_INDOOR && seating != SEATING_TYPE_BALCONY) {
    throw reservation::util::ValidationError("unknown seating type: " + reservation::model::ToString(seating));
  }
}

} // namespace

Reservation ToReservation(const ReservationRecord& record) {
  Reservation out;
  out.set_id(record.id);
  out.set_guest_name(record.guest_name);
  out.set_email(record.email);
  out.set_phone(record.phone);
  out.set_party_size(record.party_size);
  out.set_date(record.date);
  out.set_time(record.time);
  out.set_seating_type(record.seating_type);
  out.set_status(record.status);
  if (record.special_requests) {
    out.set_special_requests(*record.special_requests);
  }
  *out.mutable_created_at() = reservation::util::ToProto(reservation::util::FromUnixMillis(record.created_at_ms));
  *out.mutable_updated_at() = reservation::util::ToProto(reservation::util::FromUnixMillis(record.updated_at_ms));
  if (record.cancelled_at_ms) {
    *out.mutable_cancelled_at() = reservation::util::ToProto(reservation::util::FromUnixMillis(*record.cancelled_at_ms));
  }
  if (record.cancellation_reason) {
    out.set_cancellation_reason(*record.cancellation_reason);
  }
  return out;
}

ReservationLifecycle::ReservationLifecycle(std::shared_ptr<reservation::db::Repository>             repository,
                                           std::shared_ptr<reservation::settings::SettingsProvider> settings,
                                           std::shared_ptr<SlotReservation> slots, std::shared_ptr<BlockedDateRegistry> blocked_dates,
                                           reservation::util::NowFn now)
    : repository_(std::move(repository)),
      settings_(std::move(settings)),
      slots_(std::move(slots)),
      blocked_dates_(std::move(blocked_dates)),
      now_(std::move(now)) {
}

std::string ReservationLifecycle::TodayKey() const {
  return reservation::util::FormatDateKey(settings_->Snapshot()->Today(now_()));
}

// ------------------------------------------------------------------
// Create
// ------------------------------------------------------------------

Reservation ReservationLifecycle::Create(const CreateReservationRequest& request) {
  const auto settings = settings_->Snapshot();

  ReservationRecord record;
  record.guest_name = Trim(request.guest_name());
  record.email      = Trim(request.email());
  record.phone      = Trim(request.phone());

  if (record.guest_name.empty()) {
    throw reservation::util::ValidationError("guest name is required");
  }
  if (record.guest_name.size() > kMaxNameLength) {
    throw reservation::util::ValidationError("guest name is too long");
  }
  if (!IsValidEmail(record.email)) {
    throw reservation::util::ValidationError("invalid email address: " + request.email());
  }
  if (!IsValidPhone(record.phone)) {
    throw reservation::util::ValidationError("invalid phone number: " + request.phone());
  }

  if (request.party_size() < 1) {
    throw reservation::util::ValidationError("party size must be at least 1");
  }
  if (settings->MaxPartySize() > 0 && request.party_size() > settings->MaxPartySize()) {
    throw reservation::util::ValidationError("party size exceeds the maximum of " + std::to_string(settings->MaxPartySize()));
  }

  const auto date = RequireDate(request.date());
  if (!settings->HasTimeSlot(request.time())) {
    throw reservation::util::ValidationError("unknown time slot: " + request.time());
  }
  RequireSeating(request.seating_type());

  if (!settings->IsDateWithinBookingWindow(date, settings->Today(now_()))) {
    throw reservation::util::ValidationError("Date is outside the allowed booking window");
  }

  const auto date_key = reservation::util::FormatDateKey(date);
  if (auto blocked = blocked_dates_->Find(date_key)) {
    throw reservation::util::ValidationError("Date " + date_key + " is not available for reservations: " + blocked->reason());
  }

  record.party_size   = request.party_size();
  record.date         = date_key;
  record.time         = request.time();
  record.seating_type = request.seating_type();
  if (request.has_special_requests()) {
    record.special_requests = request.special_requests();
  }

  const auto id = slots_->ReserveSlot(*settings, std::move(record));
  return Get(id);
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

Reservation ReservationLifecycle::Get(const std::string& id) const {
  auto tx     = repository_->Begin();
  auto record = repository_->GetReservation(*tx, id);
  tx->Commit();

  if (!record) {
    throw reservation::util::NotFound("Reservation not found: " + id);
  }
  return ToReservation(*record);
}

ListReservationsResponse ReservationLifecycle::List(const ListReservationsRequest& request) const {
  reservation::db::ReservationFilter filter;
  if (request.status() != RESERVATION_STATUS_UNSPECIFIED) {
    filter.statuses.push_back(request.status());
  }
  if (!request.date().empty()) {
    filter.date = reservation::util::FormatDateKey(RequireDate(request.date()));
  }
  if (!request.email().empty()) {
    filter.email = request.email();
  }
  if (request.seating_type() != SEATING_TYPE_UNSPECIFIED) {
    filter.seating = request.seating_type();
  }

  reservation::db::Pagination pagination;
  if (request.limit() > 0) {
    pagination.limit = request.limit();
  }
  pagination.offset = request.offset();

  auto tx      = repository_->Begin();
  auto records = repository_->ListReservations(*tx, filter, pagination);
  tx->Commit();

  ListReservationsResponse out;
  for (const auto& record : records) {
    *out.add_reservations() = ToReservation(record);
  }
  out.set_total(static_cast<uint32_t>(records.size()));
  return out;
}

std::vector<Reservation> ReservationLifecycle::TodayReservations() const {
  reservation::db::ReservationFilter filter;
  filter.statuses = {RESERVATION_STATUS_CONFIRMED, RESERVATION_STATUS_SEATED};
  filter.date     = TodayKey();

  reservation::db::Pagination pagination;
  pagination.limit = reservation::db::Pagination::kUnbounded;

  auto tx      = repository_->Begin();
  auto records = repository_->ListReservations(*tx, filter, pagination);
  tx->Commit();

  std::stable_sort(records.begin(), records.end(), [](const ReservationRecord& a, const ReservationRecord& b) {
    return std::tie(a.time, a.created_at_ms) < std::tie(b.time, b.created_at_ms);
  });

  std::vector<Reservation> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(ToReservation(record));
  }
  return out;
}

DailyStats ReservationLifecycle::Stats(const std::string& date) const {
  reservation::db::ReservationFilter filter;
  const auto& occupying = reservation::model::OccupyingStatuses();
  filter.statuses.assign(occupying.begin(), occupying.end());
  filter.date = date.empty() ? TodayKey() : reservation::util::FormatDateKey(RequireDate(date));

  reservation::db::Pagination pagination;
  pagination.limit = reservation::db::Pagination::kUnbounded;

  auto tx      = repository_->Begin();
  auto records = repository_->ListReservations(*tx, filter, pagination);
  tx->Commit();

  DailyStats stats;
  stats.date         = *filter.date;
  stats.reservations = static_cast<uint32_t>(records.size());
  for (const auto& record : records) {
    stats.guests += record.party_size;
  }
  return stats;
}

// ------------------------------------------------------------------
// Mutations
// ------------------------------------------------------------------

void ReservationLifecycle::ApplyTransition(ReservationRecord& record, ReservationStatus to, const std::optional<std::string>& reason,
                                           uint64_t now_ms) {
  if (!reservation::model::CanTransition(record.status, to)) {
    throw reservation::util::ValidationError("Cannot transition from " + reservation::model::ToString(record.status) + " to " +
                                             reservation::model::ToString(to));
  }

  record.status        = to;
  record.updated_at_ms = now_ms;
  if (to == RESERVATION_STATUS_CANCELLED) {
    record.cancelled_at_ms = now_ms;
    if (reason && !reason->empty()) {
      record.cancellation_reason = *reason;
    }
  }
}

Reservation ReservationLifecycle::Mutate(const std::string& id, const Mutation& mutate) {
  const auto& policy = slots_->Policy();

  for (uint32_t attempt = 1; attempt <= policy.max_attempts; ++attempt) {
    try {
      auto tx     = repository_->Begin();
      auto record = repository_->GetReservation(*tx, id);
      if (!record) {
        throw reservation::util::NotFound("Reservation not found: " + id);
      }

      mutate(*record);

      ThrowIfDbError(repository_->UpdateReservation(*tx, *record), "update reservation " + id);
      tx->Commit();
      return ToReservation(*record);
    } catch (const reservation::db::SerializationFailure& e) {
      RESERVATION_LOG_WARN("reservation update conflict", {observability::ReservationIdField(id),
                                                           observability::IntField("attempt", attempt),
                                                           observability::StringField("error", e.what())});
    }

    if (attempt < policy.max_attempts && policy.backoff.count() > 0) {
      std::this_thread::sleep_for(policy.backoff * attempt);
    }
  }

  throw reservation::util::TransientConflict("could not update reservation " + id + " after " +
                                             std::to_string(policy.max_attempts) + " attempts");
}

Reservation ReservationLifecycle::UpdateStatus(const std::string& id, ReservationStatus status, const std::optional<std::string>& reason) {
  if (status == RESERVATION_STATUS_UNSPECIFIED) {
    throw reservation::util::ValidationError("target status is required");
  }

  auto updated = Mutate(id, [&](ReservationRecord& record) {
    ApplyTransition(record, status, reason, reservation::util::ToUnixMillis(now_()));
  });

  RESERVATION_LOG_INFO("reservation status updated",
                       {observability::ReservationIdField(id), observability::StringField("status", reservation::model::ToString(status))});
  return updated;
}

Reservation ReservationLifecycle::Cancel(const std::string& id, const std::optional<std::string>& reason) {
  const auto settings = settings_->Snapshot();

  auto cancelled = Mutate(id, [&](ReservationRecord& record) {
    if (record.status == RESERVATION_STATUS_CANCELLED) {
      throw reservation::util::ValidationError("Reservation is already cancelled");
    }
    if (record.status == RESERVATION_STATUS_COMPLETED || record.status == RESERVATION_STATUS_NO_SHOW) {
      throw reservation::util::ValidationError("Cannot cancel a reservation with status: " + reservation::model::ToString(record.status));
    }

    const auto date = RequireDate(record.date);
    const auto time = reservation::util::ParseSlotTime(record.time);
    if (!time) {
      throw std::runtime_error("stored reservation " + id + " has malformed time " + record.time);
    }

    const auto now    = now_();
    const auto starts = reservation::util::SlotStart(date, *time, settings->UtcOffset());
    const auto hours  = std::chrono::duration<double, std::ratio<3600>>(starts - now).count();
    const auto window = settings->CancellationWindowHours();
    if (hours < static_cast<double>(window)) {
      const auto floored = static_cast<int64_t>(std::floor(hours));
      throw reservation::util::PreconditionFailed("Reservations must be cancelled at least " + std::to_string(window) +
                                                      " hours in advance. This reservation is in " + std::to_string(floored) + " hours.",
                                                  window, floored);
    }

    ApplyTransition(record, RESERVATION_STATUS_CANCELLED, reason, reservation::util::ToUnixMillis(now));
  });

  RESERVATION_LOG_INFO("reservation cancelled", {observability::ReservationIdField(id)});
  return cancelled;
}

void ReservationLifecycle::Delete(const std::string& id) {
  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteReservation(*tx, id), "Reservation not found: " + id);
  tx->Commit();

  RESERVATION_LOG_INFO("reservation deleted", {observability::ReservationIdField(id)});
}

} // namespace reservation::core
