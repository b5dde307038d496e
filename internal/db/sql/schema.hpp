#pragma once

#include <string>
#include <vector>

namespace reservation::db::sql {

/*
  Bootstrap DDL, applied idempotently at startup.

  The occupancy index matches the SlotKey lookup done on every
  availability read and every reservation commit.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS reservations (id TEXT PRIMARY KEY, guest_name TEXT NOT NULL, email TEXT NOT NULL, phone TEXT NOT NULL, "
      "party_size INTEGER NOT NULL, date TEXT NOT NULL, time TEXT NOT NULL, seating_type INTEGER NOT NULL, status INTEGER NOT NULL, "
      "special_requests TEXT, created_at_ms INTEGER NOT NULL, updated_at_ms INTEGER NOT NULL, cancelled_at_ms INTEGER, cancellation_reason TEXT);",
      "CREATE INDEX IF NOT EXISTS reservations_slot_idx ON reservations(date, time, seating_type, status);",
      "CREATE INDEX IF NOT EXISTS reservations_email_idx ON reservations(email);",
      "CREATE TABLE IF NOT EXISTS slot_locks (slot_key TEXT PRIMARY KEY, last_reservation_id TEXT NOT NULL, last_reservation_at_ms INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS blocked_dates (date TEXT PRIMARY KEY, reason TEXT NOT NULL, created_at_ms INTEGER NOT NULL);"};
  return kSchema;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS reservations (id TEXT PRIMARY KEY, guest_name TEXT NOT NULL, email TEXT NOT NULL, phone TEXT NOT NULL, "
      "party_size INTEGER NOT NULL, date TEXT NOT NULL, time TEXT NOT NULL, seating_type SMALLINT NOT NULL, status SMALLINT NOT NULL, "
      "special_requests TEXT, created_at_ms BIGINT NOT NULL, updated_at_ms BIGINT NOT NULL, cancelled_at_ms BIGINT, cancellation_reason TEXT);",
      "CREATE INDEX IF NOT EXISTS reservations_slot_idx ON reservations(date, time, seating_type, status);",
      "CREATE INDEX IF NOT EXISTS reservations_email_idx ON reservations(email);",
      "CREATE TABLE IF NOT EXISTS slot_locks (slot_key TEXT PRIMARY KEY, last_reservation_id TEXT NOT NULL, last_reservation_at_ms BIGINT NOT NULL);",
      "CREATE TABLE IF NOT EXISTS blocked_dates (date TEXT PRIMARY KEY, reason TEXT NOT NULL, created_at_ms BIGINT NOT NULL);"};
  return kSchema;
}

} // namespace reservation::db::sql
