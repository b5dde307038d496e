#pragma once

#include <memory>
#include <set>
#include <string>
#include <utility>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace reservation::db::memory {

/*
  Transaction = shared snapshot + lazy private copy + tracked reads

  Reads go to the committed snapshot taken at Begin(). The first write
  copies it; read-only transactions never copy. Commit validates that no
  tracked record changed since the snapshot and writes back only the
  records this transaction touched.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository::State&       Mutable();
  const MemoryRepository::State& View() const {
    return working_ ? *working_ : *snapshot_;
  }

  void TrackRead(MemoryRepository::Table table, const std::string& id);
  void MarkDirty(MemoryRepository::Table table, const std::string& id);

 private:
  static uint64_t VersionOf(const MemoryRepository::VersionMap& versions, const std::string& key);

  template <typename Map>
  static void WriteBack(const Map& from, Map& to, const std::string& id);

  MemoryRepository&                                         repo_;
  std::shared_ptr<const MemoryRepository::State>            snapshot_;
  std::unique_ptr<MemoryRepository::State>                  working_;
  MemoryRepository::VersionMap                              read_set_;
  std::set<std::pair<MemoryRepository::Table, std::string>> dirty_;
  bool                                                      committed_   = false;
  bool                                                      rolled_back_ = false;
};

} // namespace reservation::db::memory
