#pragma once

#include <string>

#include "internal/db/api/result.hpp"

namespace reservation::core {

/*
  Translates a repository Result into the service error taxonomy.

  Busy and SerializationFailure become db::SerializationFailure so the
  enclosing retry loop restarts the unit.
*/
void ThrowIfDbError(const reservation::db::Result& result, const std::string& context);

} // namespace reservation::core
