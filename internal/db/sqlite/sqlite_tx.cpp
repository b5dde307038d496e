#include "sqlite_tx.hpp"

#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"

namespace reservation::db::sqlite {

namespace {

bool IsBusy(int rc) {
  return (rc & 0xFF) == SQLITE_BUSY || (rc & 0xFF) == SQLITE_LOCKED;
}

} // namespace

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)), lock_(db_->TransactionMutex()) {
  std::string error;
  const int   rc = db_->TryExec("BEGIN IMMEDIATE;", &error);
  if (IsBusy(rc)) {
    throw SerializationFailure("sqlite begin: " + error);
  }
  if (rc != SQLITE_OK) {
    throw std::runtime_error("sqlite begin: " + error);
  }
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    std::string error;
    if (db_->TryExec("ROLLBACK;", &error) != SQLITE_OK) {
      RESERVATION_LOG_WARN("sqlite rollback failed", {reservation::observability::StringField("error", error)});
    }
  }
}

void SqliteTransaction::Commit() {
  std::string error;
  const int   rc = db_->TryExec("COMMIT;", &error);
  if (rc != SQLITE_OK) {
    // The transaction is still open after a failed COMMIT; the destructor rolls it back.
    if (IsBusy(rc)) {
      throw SerializationFailure("sqlite commit: " + error);
    }
    throw std::runtime_error("sqlite commit: " + error);
  }
  committed_ = true;
  finished_  = true;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  if (finished_) {
    return;
  }
  db_->Exec("ROLLBACK;");
  finished_ = true;
  lock_.unlock();
}

} // namespace reservation::db::sqlite
