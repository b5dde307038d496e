#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"
#include "reservation/engine/v1.hpp"

namespace reservation::db::sqlite {

using reservation::db::ErrorCode;
using reservation::db::Result;
using namespace reservation::engine::v1;

namespace {

// Finalizes the statement on every exit path.
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr) != SQLITE_OK) {
      st_ = nullptr;
    }
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  sqlite3_stmt* get() const {
    return st_;
  }
  explicit operator bool() const {
    return st_ != nullptr;
  }

 private:
  sqlite3_stmt* st_ = nullptr;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (s) {
    BindText(st, idx, *s);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindOptU64(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& v) {
  if (v) {
    BindU64(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

std::optional<uint64_t> ColOptU64(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColU64(st, col);
}

int ColI32(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col);
}

model::ReservationRecord ReadReservation(sqlite3_stmt* st) {
  model::ReservationRecord r;
  r.id                  = ColText(st, 0);
  r.guest_name          = ColText(st, 1);
  r.email               = ColText(st, 2);
  r.phone               = ColText(st, 3);
  r.party_size          = static_cast<uint32_t>(ColI32(st, 4));
  r.date                = ColText(st, 5);
  r.time                = ColText(st, 6);
  r.seating_type        = static_cast<SeatingType>(ColI32(st, 7));
  r.status              = static_cast<ReservationStatus>(ColI32(st, 8));
  r.special_requests    = ColOptText(st, 9);
  r.created_at_ms       = ColU64(st, 10);
  r.updated_at_ms       = ColU64(st, 11);
  r.cancelled_at_ms     = ColOptU64(st, 12);
  r.cancellation_reason = ColOptText(st, 13);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
    return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Reservations
// ------------------------------------------------------------------

Result SqliteRepository::InsertReservation(Transaction& t, const model::ReservationRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::INSERT_RESERVATION);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.id);
  BindText(st.get(), 2, r.guest_name);
  BindText(st.get(), 3, r.email);
  BindText(st.get(), 4, r.phone);
  BindI32(st.get(), 5, static_cast<int>(r.party_size));
  BindText(st.get(), 6, r.date);
  BindText(st.get(), 7, r.time);
  BindI32(st.get(), 8, static_cast<int>(r.seating_type));
  BindI32(st.get(), 9, static_cast<int>(r.status));
  BindOptText(st.get(), 10, r.special_requests);
  BindU64(st.get(), 11, r.created_at_ms);
  BindU64(st.get(), 12, r.updated_at_ms);
  BindOptU64(st.get(), 13, r.cancelled_at_ms);
  BindOptText(st.get(), 14, r.cancellation_reason);

  const int rc = sqlite3_step(st.get());
  if ((rc & 0xFF) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
  return Translate(db, rc);
}

std::optional<model::ReservationRecord>
SqliteRepository::GetReservation(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, std::string("SELECT ") + sql::kReservationColumns + " FROM reservations WHERE id=?;");
  if (!st) return std::nullopt;

  BindText(st.get(), 1, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    return std::nullopt;
  }
  return ReadReservation(st.get());
}

Result SqliteRepository::UpdateReservation(Transaction& t, const model::ReservationRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::UPDATE_RESERVATION);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.guest_name);
  BindText(st.get(), 2, r.email);
  BindText(st.get(), 3, r.phone);
  BindI32(st.get(), 4, static_cast<int>(r.party_size));
  BindText(st.get(), 5, r.date);
  BindText(st.get(), 6, r.time);
  BindI32(st.get(), 7, static_cast<int>(r.seating_type));
  BindI32(st.get(), 8, static_cast<int>(r.status));
  BindOptText(st.get(), 9, r.special_requests);
  BindU64(st.get(), 10, r.created_at_ms);
  BindU64(st.get(), 11, r.updated_at_ms);
  BindOptU64(st.get(), 12, r.cancelled_at_ms);
  BindOptText(st.get(), 13, r.cancellation_reason);
  BindText(st.get(), 14, r.id);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

Result SqliteRepository::DeleteReservation(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::DELETE_RESERVATION);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, id);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::vector<model::ReservationRecord> SqliteRepository::ListReservations(Transaction& t, const ReservationFilter& filter,
                                                                         const Pagination& pagination) {
  auto* db = TX(t).Handle();

  std::string query = std::string("SELECT ") + sql::kReservationColumns + " FROM reservations WHERE 1=1";
  if (!filter.statuses.empty()) {
    query += " AND status IN (";
    for (std::size_t i = 0; i < filter.statuses.size(); ++i) {
      query += i == 0 ? "?" : ",?";
    }
    query += ")";
  }
  if (filter.date) query += " AND date=?";
  if (filter.email) query += " AND email=?";
  if (filter.seating) query += " AND seating_type=?";
  query += " ORDER BY date DESC, time DESC, created_at_ms DESC, id DESC LIMIT ? OFFSET ?;";

  Statement st(db, query);
  if (!st) return {};

  int idx = 1;
  for (const auto status : filter.statuses) BindI32(st.get(), idx++, static_cast<int>(status));
  if (filter.date) BindText(st.get(), idx++, *filter.date);
  if (filter.email) BindText(st.get(), idx++, *filter.email);
  if (filter.seating) BindI32(st.get(), idx++, static_cast<int>(*filter.seating));
  BindU64(st.get(), idx++, pagination.limit);
  BindU64(st.get(), idx++, pagination.offset);

  std::vector<model::ReservationRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    out.push_back(ReadReservation(st.get()));
  }
  return out;
}

uint64_t SqliteRepository::SumOccupyingPartySize(Transaction& t, const std::string& date, const std::string& time,
                                                 SeatingType seating) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::SUM_OCCUPYING_PARTY_SIZE);
  if (!st) throw std::runtime_error(std::string("sum occupancy: ") + sqlite3_errmsg(db));

  BindText(st.get(), 1, date);
  BindText(st.get(), 2, time);
  BindI32(st.get(), 3, static_cast<int>(seating));
  BindI32(st.get(), 4, RESERVATION_STATUS_PENDING);
  BindI32(st.get(), 5, RESERVATION_STATUS_CONFIRMED);
  BindI32(st.get(), 6, RESERVATION_STATUS_SEATED);

  if (sqlite3_step(st.get()) != SQLITE_ROW) {
    throw std::runtime_error(std::string("sum occupancy: ") + sqlite3_errmsg(db));
  }
  return ColU64(st.get(), 0);
}

// ------------------------------------------------------------------
// Slot locks
// ------------------------------------------------------------------

model::SlotLockRecord SqliteRepository::ReadSlotLock(Transaction& t, const std::string& slot_key) {
  auto* db = TX(t).Handle();

  {
    Statement ins(db, sql::INSERT_SLOT_LOCK_IF_ABSENT);
    if (!ins) throw std::runtime_error(std::string("read slot lock: ") + sqlite3_errmsg(db));
    BindText(ins.get(), 1, slot_key);
    const int rc = sqlite3_step(ins.get());
    if (rc != SQLITE_DONE) throw std::runtime_error(std::string("read slot lock: ") + sqlite3_errmsg(db));
  }

  Statement st(db, sql::SELECT_SLOT_LOCK);
  if (!st) throw std::runtime_error(std::string("read slot lock: ") + sqlite3_errmsg(db));
  BindText(st.get(), 1, slot_key);

  model::SlotLockRecord r;
  r.slot_key = slot_key;
  if (sqlite3_step(st.get()) == SQLITE_ROW) {
    r.last_reservation_id    = ColText(st.get(), 1);
    r.last_reservation_at_ms = ColU64(st.get(), 2);
  }
  return r;
}

Result SqliteRepository::UpsertSlotLock(Transaction& t, const model::SlotLockRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::UPSERT_SLOT_LOCK);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.slot_key);
  BindText(st.get(), 2, r.last_reservation_id);
  BindU64(st.get(), 3, r.last_reservation_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

// ------------------------------------------------------------------
// Blocked dates
// ------------------------------------------------------------------

Result SqliteRepository::PutBlockedDate(Transaction& t, const model::BlockedDateRecord& r) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::UPSERT_BLOCKED_DATE);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st.get(), 1, r.date);
  BindText(st.get(), 2, r.reason);
  BindU64(st.get(), 3, r.created_at_ms);

  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::BlockedDateRecord> SqliteRepository::GetBlockedDate(Transaction& t, const std::string& date) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::SELECT_BLOCKED_DATE);
  if (!st) return std::nullopt;
  BindText(st.get(), 1, date);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::BlockedDateRecord r;
  r.date          = ColText(st.get(), 0);
  r.reason        = ColText(st.get(), 1);
  r.created_at_ms = ColU64(st.get(), 2);
  return r;
}

Result SqliteRepository::DeleteBlockedDate(Transaction& t, const std::string& date) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::DELETE_BLOCKED_DATE);
  if (!st) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  BindText(st.get(), 1, date);

  const int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return Result::Ok();
}

std::vector<model::BlockedDateRecord> SqliteRepository::ListBlockedDates(Transaction& t) {
  auto* db = TX(t).Handle();

  Statement st(db, sql::LIST_BLOCKED_DATES);
  if (!st) return {};

  std::vector<model::BlockedDateRecord> out;
  while (sqlite3_step(st.get()) == SQLITE_ROW) {
    model::BlockedDateRecord r;
    r.date          = ColText(st.get(), 0);
    r.reason        = ColText(st.get(), 1);
    r.created_at_ms = ColU64(st.get(), 2);
    out.push_back(std::move(r));
  }
  return out;
}

} // namespace reservation::db::sqlite
