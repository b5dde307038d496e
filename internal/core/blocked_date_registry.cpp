#include "blocked_date_registry.hpp"

#include "internal/core/db_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace reservation::core {

using namespace reservation::engine::v1;

namespace {

BlockedDate ToBlockedDate(const reservation::db::model::BlockedDateRecord& record) {
  BlockedDate out;
  out.set_date(record.date);
  out.set_reason(record.reason);
  *out.mutable_created_at() = reservation::util::ToProto(reservation::util::FromUnixMillis(record.created_at_ms));
  return out;
}

void RequireDateKey(const std::string& date) {
  if (!reservation::util::ParseDateKey(date)) {
    throw reservation::util::ValidationError("invalid date: " + date);
  }
}

} // namespace

BlockedDateRegistry::BlockedDateRegistry(std::shared_ptr<reservation::db::Repository> repository, reservation::util::NowFn now)
    : repository_(std::move(repository)), now_(std::move(now)) {
}

BlockedDate BlockedDateRegistry::Block(const std::string& date, const std::string& reason) {
  RequireDateKey(date);

  reservation::db::model::BlockedDateRecord record;
  record.date          = date;
  record.reason        = reason;
  record.created_at_ms = reservation::util::ToUnixMillis(now_());

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->PutBlockedDate(*tx, record), "block date");
  tx->Commit();

  RESERVATION_LOG_INFO("date blocked", {observability::StringField("date", date), observability::StringField("reason", reason)});
  return ToBlockedDate(record);
}

void BlockedDateRegistry::Unblock(const std::string& date) {
  RequireDateKey(date);

  auto tx = repository_->Begin();
  ThrowIfDbError(repository_->DeleteBlockedDate(*tx, date), "date is not blocked: " + date);
  tx->Commit();

  RESERVATION_LOG_INFO("date unblocked", {observability::StringField("date", date)});
}

std::vector<BlockedDate> BlockedDateRegistry::List() const {
  auto tx      = repository_->Begin();
  auto records = repository_->ListBlockedDates(*tx);
  tx->Commit();

  std::vector<BlockedDate> out;
  out.reserve(records.size());
  for (const auto& record : records) {
    out.push_back(ToBlockedDate(record));
  }
  return out;
}

std::optional<BlockedDate> BlockedDateRegistry::Find(const std::string& date) const {
  auto tx     = repository_->Begin();
  auto record = repository_->GetBlockedDate(*tx, date);
  tx->Commit();

  if (!record) {
    return std::nullopt;
  }
  return ToBlockedDate(*record);
}

} // namespace reservation::core
