#include "result.hpp"

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace graphingest::db {

void ThrowIfDbError(const Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case ErrorCode::AlreadyExists:
      throw util::AlreadyExists(message);
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::Conflict:
    case ErrorCode::Busy:
      throw util::TransactionConflict(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace graphingest::db
