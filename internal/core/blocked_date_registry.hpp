#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/util/time.hpp"
#include "reservation/engine/v1.hpp"

namespace reservation::core {

// Administratively closed dates, keyed by canonical date.
class BlockedDateRegistry {
 public:
  BlockedDateRegistry(std::shared_ptr<reservation::db::Repository> repository, reservation::util::NowFn now);

  // Upsert; re-blocking replaces the reason.
  reservation::engine::v1::BlockedDate Block(const std::string& date, const std::string& reason);

  void Unblock(const std::string& date);

  std::vector<reservation::engine::v1::BlockedDate> List() const;

  std::optional<reservation::engine::v1::BlockedDate> Find(const std::string& date) const;

 private:
  std::shared_ptr<reservation::db::Repository> repository_;
  reservation::util::NowFn                     now_;
};

} // namespace reservation::core
