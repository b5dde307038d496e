#pragma once

#include <memory>
#include <pqxx/pqxx>

#include "internal/db/api/transaction.hpp"
#include "pg_pool.hpp"

namespace reservation::db::postgres {

using SerializableWork = pqxx::transaction<pqxx::isolation_level::serializable>;

/*
  SERIALIZABLE transaction on a pooled connection.

  SQLSTATE 40001 (serialization_failure) and 40P01 (deadlock_detected)
  surface as db::SerializationFailure so callers can retry the unit.
*/
class PgTransaction final : public db::Transaction {
public:
  explicit PgTransaction(std::shared_ptr<PgPool> pool);
  ~PgTransaction();

  SerializableWork& Work() { return *tx_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

private:
  std::shared_ptr<pqxx::connection> conn_;
  std::unique_ptr<SerializableWork> tx_;
  bool committed_ = false;
  bool finished_ = false;
};

}
