#include "db_errors.hpp"

#include <string>

#include "internal/db/api/transaction.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace edgestore::service {

void ThrowIfDbError(const db::Result& result, std::string_view what) {
  if (result) {
    return;
  }

  const std::string prefix(what);
  switch (result.code) {
    case db::ErrorCode::NotFound:
      throw util::NotFound(prefix + ": not found");
    case db::ErrorCode::AlreadyExists:
    case db::ErrorCode::ConstraintViolation:
      throw util::AlreadyExists(prefix + ": already exists");
    case db::ErrorCode::Conflict:
      throw util::StaleWrite(prefix + ": stored row is at least as new");
    case db::ErrorCode::Busy:
    case db::ErrorCode::SerializationFailure:
      throw db::TransactionConflict(prefix + ": " + result.message);
    case db::ErrorCode::PermissionDenied:
      throw util::Unauthorized(prefix + ": storage is read-only for this capability");
    case db::ErrorCode::Unsupported:
      throw util::InvalidArgument(prefix + ": " + result.message);
    default:
      break;
  }

  EDGESTORE_LOG_ERROR("storage operation failed", {observability::StringField("operation", what),
                                                   observability::StringField("code", db::ErrorCodeName(result.code)),
                                                   observability::StringField("detail", result.message)});
  throw util::TransactionAborted(prefix + ": storage failure (" + std::string(db::ErrorCodeName(result.code)) + ")");
}

} // namespace edgestore::service
