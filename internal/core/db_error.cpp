#include "db_error.hpp"

#include <stdexcept>

#include "internal/db/api/transaction.hpp"
#include "internal/util/errors.hpp"

namespace reservation::core {

void ThrowIfDbError(const reservation::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case reservation::db::ErrorCode::NotFound:
      throw reservation::util::NotFound(message);
    case reservation::db::ErrorCode::Busy:
    case reservation::db::ErrorCode::SerializationFailure:
      throw reservation::db::SerializationFailure(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace reservation::core
