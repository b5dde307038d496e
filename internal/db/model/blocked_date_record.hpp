#pragma once

#include <cstdint>
#include <string>

namespace reservation::db::model {

struct BlockedDateRecord {
  std::string date;  // "YYYY-MM-DD"
  std::string reason;

  uint64_t created_at_ms = 0;
};

}
