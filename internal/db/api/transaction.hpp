#pragma once

#include <stdexcept>
#include <string>

namespace reservation::db {

/*
  Abstract transaction.

  Semantics guaranteed for ALL backends:

  - Changes are invisible until Commit()
  - After Commit() all reads see the change
  - Rollback() discards all writes
  - Destructor MUST rollback if not committed
  - Commit() throws SerializationFailure when a conflict-tracked read
    was invalidated by a concurrent commit; nothing is applied

  SQLite: BEGIN IMMEDIATE
  Postgres: SERIALIZABLE pqxx transaction
  Memory: snapshot copy + versioned write-back
*/

class Transaction {
public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

/*
  Raised when the backend detects that the transaction cannot be serialized
  with a concurrent one. The whole unit may be retried from the start.
*/
class SerializationFailure : public std::runtime_error {
 public:
  explicit SerializationFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

}
