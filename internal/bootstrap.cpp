#include "bootstrap.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

#include "internal/core/availability_calculator.hpp"
#include "internal/core/blocked_date_registry.hpp"
#include "internal/core/daily_availability.hpp"
#include "internal/core/reservation_lifecycle.hpp"
#include "internal/core/slot_reservation.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"
#include "internal/settings/settings_provider.hpp"
#if RESERVATION_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if RESERVATION_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace reservation::bootstrap {

namespace {

constexpr uint32_t kDefaultMaxCommitAttempts = 5;
constexpr uint32_t kDefaultRetryBackoffMs    = 10;

#if RESERVATION_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::SqliteSchema()) {
    sqlite_db->Exec(sql);
  }
}
#endif

core::RetryPolicy ResolveRetryPolicy(const runtime::config::RuntimeConfig& config) {
  core::RetryPolicy policy;
  policy.max_attempts =
      config.reservation().max_commit_attempts() > 0 ? config.reservation().max_commit_attempts() : kDefaultMaxCommitAttempts;
  policy.backoff = std::chrono::milliseconds(config.has_reservation() ? config.reservation().retry_backoff_ms() : kDefaultRetryBackoffMs);
  return policy;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if RESERVATION_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    BootstrapSqliteSchema(sqlite_db);
    RESERVATION_LOG_INFO("using sqlite repository", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if RESERVATION_DB_POSTGRES
    const auto max_connections = database.postgres().max_connections() > 0 ? database.postgres().max_connections() : 16;
    auto       pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), max_connections);
    pool->Bootstrap(db::sql::PostgresSchema());
    RESERVATION_LOG_INFO("using postgres repository", {observability::IntField("max_connections", max_connections)});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  RESERVATION_LOG_INFO("using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

service::ServiceContext BuildServiceContext(const runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository,
                                            util::NowFn now) {
  const auto booking  = settings::BookingSettings::Overlay(settings::BookingSettings::Defaults(), config.booking());
  auto       settings = std::make_shared<settings::CachedSettingsProvider>(booking);

  auto blocked_dates = std::make_shared<core::BlockedDateRegistry>(repository, now);
  for (const auto& seed : config.blocked_dates()) {
    blocked_dates->Block(seed.date(), seed.reason());
  }

  auto calculator = std::make_shared<core::AvailabilityCalculator>(repository, settings);
  auto daily      = std::make_shared<core::DailyAvailabilityAggregator>(calculator, blocked_dates, settings);
  auto slots      = std::make_shared<core::SlotReservation>(repository, ResolveRetryPolicy(config), now);
  auto lifecycle  = std::make_shared<core::ReservationLifecycle>(repository, settings, slots, blocked_dates, now);

  service::ServiceContext ctx;
  ctx.lifecycle     = lifecycle;
  ctx.calculator    = calculator;
  ctx.daily         = daily;
  ctx.blocked_dates = blocked_dates;
  ctx.settings      = settings;
  return ctx;
}

} // namespace reservation::bootstrap
