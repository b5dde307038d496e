#include "pg_pool.hpp"

namespace reservation::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (...) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::Bootstrap(const std::vector<std::string>& statements) {
  auto       conn = Acquire();
  pqxx::work tx(*conn);
  for (const auto& stmt : statements) {
    tx.exec(stmt);
  }
  tx.commit();
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("get_reservation",
               "SELECT id,guest_name,email,phone,party_size,date,time,seating_type,status,"
               "special_requests,created_at_ms,updated_at_ms,cancelled_at_ms,cancellation_reason "
               "FROM reservations WHERE id=$1");

  conn.prepare("insert_reservation",
               "INSERT INTO reservations(id,guest_name,email,phone,party_size,date,time,seating_type,status,"
               "special_requests,created_at_ms,updated_at_ms,cancelled_at_ms,cancellation_reason) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9,$10,$11,$12,$13,$14)");

  conn.prepare("update_reservation",
               "UPDATE reservations SET guest_name=$2,email=$3,phone=$4,party_size=$5,date=$6,time=$7,"
               "seating_type=$8,status=$9,special_requests=$10,created_at_ms=$11,updated_at_ms=$12,"
               "cancelled_at_ms=$13,cancellation_reason=$14 WHERE id=$1");

  conn.prepare("delete_reservation", "DELETE FROM reservations WHERE id=$1");

  conn.prepare("sum_occupying_party_size",
               "SELECT COALESCE(SUM(party_size),0) FROM reservations "
               "WHERE date=$1 AND time=$2 AND seating_type=$3 AND status IN ($4,$5,$6)");

  // Row lock on the serialization record; SERIALIZABLE does the rest.
  conn.prepare("ensure_slot_lock",
               "INSERT INTO slot_locks(slot_key,last_reservation_id,last_reservation_at_ms) "
               "VALUES($1,'',0) ON CONFLICT(slot_key) DO NOTHING");

  conn.prepare("lock_slot_lock",
               "SELECT slot_key,last_reservation_id,last_reservation_at_ms FROM slot_locks "
               "WHERE slot_key=$1 FOR UPDATE");

  conn.prepare("upsert_slot_lock",
               "INSERT INTO slot_locks(slot_key,last_reservation_id,last_reservation_at_ms) VALUES($1,$2,$3) "
               "ON CONFLICT(slot_key) DO UPDATE SET "
               "last_reservation_id=CASE WHEN EXCLUDED.last_reservation_id<>'' THEN EXCLUDED.last_reservation_id "
               "ELSE slot_locks.last_reservation_id END,"
               "last_reservation_at_ms=CASE WHEN EXCLUDED.last_reservation_at_ms<>0 THEN EXCLUDED.last_reservation_at_ms "
               "ELSE slot_locks.last_reservation_at_ms END");

  conn.prepare("upsert_blocked_date",
               "INSERT INTO blocked_dates(date,reason,created_at_ms) VALUES($1,$2,$3) "
               "ON CONFLICT(date) DO UPDATE SET reason=EXCLUDED.reason,created_at_ms=EXCLUDED.created_at_ms");

  conn.prepare("get_blocked_date", "SELECT date,reason,created_at_ms FROM blocked_dates WHERE date=$1");

  conn.prepare("delete_blocked_date", "DELETE FROM blocked_dates WHERE date=$1");

  conn.prepare("list_blocked_dates", "SELECT date,reason,created_at_ms FROM blocked_dates ORDER BY date ASC");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace reservation::db::postgres
