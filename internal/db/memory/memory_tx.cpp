#include "memory_tx.hpp"

namespace reservation::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo), snapshot_(repo.Snapshot()) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

uint64_t MemoryTransaction::VersionOf(const MemoryRepository::VersionMap& versions, const std::string& key) {
  const auto it = versions.find(key);
  return it == versions.end() ? 0 : it->second;
}

MemoryRepository::State& MemoryTransaction::Mutable() {
  if (!working_) {
    working_ = std::make_unique<MemoryRepository::State>(*snapshot_); // copy on first write
  }
  return *working_;
}

void MemoryTransaction::TrackRead(MemoryRepository::Table table, const std::string& id) {
  const auto key = MemoryRepository::VersionKey(table, id);
  read_set_.try_emplace(key, VersionOf(snapshot_->versions, key));
}

void MemoryTransaction::MarkDirty(MemoryRepository::Table table, const std::string& id) {
  dirty_.emplace(table, id);
}

template <typename Map>
void MemoryTransaction::WriteBack(const Map& from, Map& to, const std::string& id) {
  const auto it = from.find(id);
  if (it == from.end()) {
    to.erase(id);
  } else {
    to[id] = it->second;
  }
}

void MemoryTransaction::Commit() {
  std::scoped_lock lock(repo_.mutex_);

  const auto& current = *repo_.committed_;
  for (const auto& [key, observed] : read_set_) {
    if (VersionOf(current.versions, key) != observed) {
      rolled_back_ = true;
      throw SerializationFailure("transaction conflict: " + key + " was modified by a concurrent transaction");
    }
  }

  if (!dirty_.empty()) {
    auto next = std::make_shared<MemoryRepository::State>(current);
    for (const auto& [table, id] : dirty_) {
      bool present = false;
      switch (table) {
        case MemoryRepository::Table::kReservation:
          WriteBack(working_->reservations, next->reservations, id);
          present = next->reservations.contains(id);
          break;
        case MemoryRepository::Table::kSlotLock:
          WriteBack(working_->slot_locks, next->slot_locks, id);
          present = next->slot_locks.contains(id);
          break;
        case MemoryRepository::Table::kBlockedDate:
          WriteBack(working_->blocked_dates, next->blocked_dates, id);
          present = next->blocked_dates.contains(id);
          break;
      }

      const auto key = MemoryRepository::VersionKey(table, id);
      if (present) {
        next->versions[key] = ++repo_.commit_seq_;
      } else {
        next->versions.erase(key);
      }
    }
    repo_.committed_ = std::move(next);
  }
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  rolled_back_ = true;
}

} // namespace reservation::db::memory
