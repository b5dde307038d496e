#include "pg_repository.hpp"

#include "reservation/engine/v1.hpp"

namespace reservation::db::postgres {

using namespace reservation::engine::v1;

namespace {

model::ReservationRecord ReadReservation(const pqxx::row& row) {
  model::ReservationRecord r;
  r.id           = row[0].c_str();
  r.guest_name   = row[1].c_str();
  r.email        = row[2].c_str();
  r.phone        = row[3].c_str();
  r.party_size   = row[4].as<uint32_t>();
  r.date         = row[5].c_str();
  r.time         = row[6].c_str();
  r.seating_type = static_cast<SeatingType>(row[7].as<int>());
  r.status       = static_cast<ReservationStatus>(row[8].as<int>());
  if (!row[9].is_null()) r.special_requests = row[9].c_str();
  r.created_at_ms = row[10].as<uint64_t>();
  r.updated_at_ms = row[11].as<uint64_t>();
  if (!row[12].is_null()) r.cancelled_at_ms = row[12].as<uint64_t>();
  if (!row[13].is_null()) r.cancellation_reason = row[13].c_str();
  return r;
}

model::BlockedDateRecord ReadBlockedDate(const pqxx::row& row) {
  model::BlockedDateRecord r;
  r.date          = row[0].c_str();
  r.reason        = row[1].c_str();
  r.created_at_ms = row[2].as<uint64_t>();
  return r;
}

// Aborted postgres transactions are not usable afterwards; the whole unit
// has to restart, which is what SerializationFailure tells the caller.
template <typename Fn>
auto Serializable(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const pqxx::transaction_rollback& e) {
    throw SerializationFailure(e.what());
  }
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::transaction_rollback*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertReservation(Transaction& t, const model::ReservationRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_reservation", r.id, r.guest_name, r.email, r.phone,
                               static_cast<int>(r.party_size), r.date, r.time, static_cast<int>(r.seating_type),
                               static_cast<int>(r.status), r.special_requests, r.created_at_ms, r.updated_at_ms,
                               r.cancelled_at_ms, r.cancellation_reason);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ReservationRecord> PgRepository::GetReservation(Transaction& t, const std::string& id) {
  return Serializable([&]() -> std::optional<model::ReservationRecord> {
    auto res = TX(t).Work().exec_prepared("get_reservation", id);
    if (res.empty()) return std::nullopt;
    return ReadReservation(res[0]);
  });
}

Result PgRepository::UpdateReservation(Transaction& t, const model::ReservationRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_reservation", r.id, r.guest_name, r.email, r.phone,
                                          static_cast<int>(r.party_size), r.date, r.time,
                                          static_cast<int>(r.seating_type), static_cast<int>(r.status),
                                          r.special_requests, r.created_at_ms, r.updated_at_ms, r.cancelled_at_ms,
                                          r.cancellation_reason);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteReservation(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_reservation", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ReservationRecord> PgRepository::ListReservations(Transaction& t, const ReservationFilter& filter,
                                                                     const Pagination& pagination) {
  auto&        work = TX(t).Work();
  pqxx::params params;
  int          n = 0;

  std::string query =
      "SELECT id,guest_name,email,phone,party_size,date,time,seating_type,status,"
      "special_requests,created_at_ms,updated_at_ms,cancelled_at_ms,cancellation_reason "
      "FROM reservations WHERE TRUE";
  if (!filter.statuses.empty()) {
    query += " AND status IN (";
    for (std::size_t i = 0; i < filter.statuses.size(); ++i) {
      query += (i == 0 ? "$" : ",$") + std::to_string(++n);
      params.append(static_cast<int>(filter.statuses[i]));
    }
    query += ")";
  }
  if (filter.date) {
    query += " AND date=$" + std::to_string(++n);
    params.append(*filter.date);
  }
  if (filter.email) {
    query += " AND email=$" + std::to_string(++n);
    params.append(*filter.email);
  }
  if (filter.seating) {
    query += " AND seating_type=$" + std::to_string(++n);
    params.append(static_cast<int>(*filter.seating));
  }
  query += " ORDER BY date DESC, time DESC, created_at_ms DESC, id DESC";
  query += " LIMIT $" + std::to_string(++n);
  params.append(static_cast<int64_t>(pagination.limit));
  query += " OFFSET $" + std::to_string(++n);
  params.append(static_cast<int64_t>(pagination.offset));

  return Serializable([&] {
    auto res = work.exec_params(query, params);

    std::vector<model::ReservationRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadReservation(row));
    }
    return out;
  });
}

uint64_t PgRepository::SumOccupyingPartySize(Transaction& t, const std::string& date, const std::string& time,
                                             SeatingType seating) {
  return Serializable([&] {
    auto res = TX(t).Work().exec_prepared("sum_occupying_party_size", date, time, static_cast<int>(seating),
                                          static_cast<int>(RESERVATION_STATUS_PENDING),
                                          static_cast<int>(RESERVATION_STATUS_CONFIRMED),
                                          static_cast<int>(RESERVATION_STATUS_SEATED));
    return res[0][0].as<uint64_t>();
  });
}

model::SlotLockRecord PgRepository::ReadSlotLock(Transaction& t, const std::string& slot_key) {
  return Serializable([&] {
    auto& work = TX(t).Work();
    work.exec_prepared("ensure_slot_lock", slot_key);
    auto res = work.exec_prepared("lock_slot_lock", slot_key);

    model::SlotLockRecord r;
    r.slot_key = slot_key;
    if (!res.empty()) {
      r.last_reservation_id    = res[0][1].c_str();
      r.last_reservation_at_ms = res[0][2].as<uint64_t>();
    }
    return r;
  });
}

Result PgRepository::UpsertSlotLock(Transaction& t, const model::SlotLockRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_slot_lock", r.slot_key, r.last_reservation_id, r.last_reservation_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::PutBlockedDate(Transaction& t, const model::BlockedDateRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_blocked_date", r.date, r.reason, r.created_at_ms);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::BlockedDateRecord> PgRepository::GetBlockedDate(Transaction& t, const std::string& date) {
  return Serializable([&]() -> std::optional<model::BlockedDateRecord> {
    auto res = TX(t).Work().exec_prepared("get_blocked_date", date);
    if (res.empty()) return std::nullopt;
    return ReadBlockedDate(res[0]);
  });
}

Result PgRepository::DeleteBlockedDate(Transaction& t, const std::string& date) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_blocked_date", date);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::BlockedDateRecord> PgRepository::ListBlockedDates(Transaction& t) {
  return Serializable([&] {
    auto res = TX(t).Work().exec_prepared("list_blocked_dates");

    std::vector<model::BlockedDateRecord> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(ReadBlockedDate(row));
    }
    return out;
  });
}

}
