#pragma once

namespace reservation::db::sql {

/*
  Canonical SQL used by the SQLite backend.

  Postgres keeps its own $n-parameter variants as prepared statements
  installed by PgPool.
*/

static constexpr const char* kReservationColumns =
    "id,guest_name,email,phone,party_size,date,time,seating_type,status,"
    "special_requests,created_at_ms,updated_at_ms,cancelled_at_ms,cancellation_reason";

static constexpr const char* INSERT_RESERVATION =
    "INSERT INTO reservations(id,guest_name,email,phone,party_size,date,time,seating_type,status,"
    "special_requests,created_at_ms,updated_at_ms,cancelled_at_ms,cancellation_reason)"
    " VALUES(?,?,?,?,?,?,?,?,?,?,?,?,?,?);";

static constexpr const char* UPDATE_RESERVATION =
    "UPDATE reservations SET guest_name=?,email=?,phone=?,party_size=?,date=?,time=?,seating_type=?,status=?,"
    "special_requests=?,created_at_ms=?,updated_at_ms=?,cancelled_at_ms=?,cancellation_reason=?"
    " WHERE id=?;";

static constexpr const char* DELETE_RESERVATION =
    "DELETE FROM reservations WHERE id=?;";

// status placeholders: pending, confirmed, seated
static constexpr const char* SUM_OCCUPYING_PARTY_SIZE =
    "SELECT COALESCE(SUM(party_size),0) FROM reservations"
    " WHERE date=? AND time=? AND seating_type=? AND status IN (?,?,?);";

// slot locks

static constexpr const char* INSERT_SLOT_LOCK_IF_ABSENT =
    "INSERT INTO slot_locks(slot_key,last_reservation_id,last_reservation_at_ms)"
    " VALUES(?,'',0) ON CONFLICT(slot_key) DO NOTHING;";

static constexpr const char* SELECT_SLOT_LOCK =
    "SELECT slot_key,last_reservation_id,last_reservation_at_ms FROM slot_locks WHERE slot_key=?;";

static constexpr const char* UPSERT_SLOT_LOCK =
    "INSERT INTO slot_locks(slot_key,last_reservation_id,last_reservation_at_ms)"
    " VALUES(?,?,?)"
    " ON CONFLICT(slot_key) DO UPDATE SET"
    " last_reservation_id=CASE WHEN excluded.last_reservation_id<>'' THEN excluded.last_reservation_id ELSE slot_locks.last_reservation_id END,"
    " last_reservation_at_ms=CASE WHEN excluded.last_reservation_at_ms<>0 THEN excluded.last_reservation_at_ms ELSE slot_locks.last_reservation_at_ms END;";

// blocked dates

static constexpr const char* UPSERT_BLOCKED_DATE =
    "INSERT INTO blocked_dates(date,reason,created_at_ms) VALUES(?,?,?)"
    " ON CONFLICT(date) DO UPDATE SET reason=excluded.reason,created_at_ms=excluded.created_at_ms;";

static constexpr const char* SELECT_BLOCKED_DATE =
    "SELECT date,reason,created_at_ms FROM blocked_dates WHERE date=?;";

static constexpr const char* DELETE_BLOCKED_DATE =
    "DELETE FROM blocked_dates WHERE date=?;";

static constexpr const char* LIST_BLOCKED_DATES =
    "SELECT date,reason,created_at_ms FROM blocked_dates ORDER BY date ASC;";

} // namespace reservation::db::sql
