#pragma once

#include <string_view>

#include "internal/db/api/result.hpp"

namespace edgestore::service {

/*
  Translates a repository Result into the engine error taxonomy.

    NotFound                             -> util::NotFound
    AlreadyExists, ConstraintViolation   -> util::AlreadyExists
    Conflict                             -> util::StaleWrite
    Busy, SerializationFailure           -> db::TransactionConflict (retried)
    PermissionDenied                     -> util::Unauthorized
    anything else                        -> util::TransactionAborted

  Backend detail is logged, never returned to the caller.
*/
void ThrowIfDbError(const edgestore::db::Result& result, std::string_view what);

} // namespace edgestore::service
