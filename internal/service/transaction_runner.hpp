#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <exception>
#include <string>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/readiness.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/deadline.hpp"
#include "internal/util/errors.hpp"

namespace edgestore::service {

inline util::Deadline ResolveDeadline(const ServiceContext& ctx, const OperationOptions& options) {
  if (options.timeout) {
    return util::Deadline::After(*options.timeout);
  }
  return util::Deadline::After(std::chrono::milliseconds(ctx.config.transactions().default_timeout_ms()));
}

/*
  Runs fn(tx, deadline) in one transaction and commits it.

  - readiness is checked before anything else
  - the deadline is checked before every attempt and before commit
  - db::TransactionConflict (commit refused, busy database) restarts the
    whole attempt up to transactions.max_conflict_retries times
  - util::Error thrown by fn propagates unchanged; the transaction rolls back
  - any other failure becomes TransactionAborted

  fn must not open another transaction on the same repository.
  RunInTransactionUntil takes an absolute deadline shared by several calls.
*/
template <typename Fn>
auto RunInTransactionUntil(const ServiceContext& ctx, const util::Deadline& deadline, std::string_view operation, Fn&& fn) {
  using ResultT = std::invoke_result_t<Fn&, db::Transaction&, const util::Deadline&>;

  if (ctx.readiness) {
    ctx.readiness->Require(operation);
  }

  const std::uint32_t max_retries = ctx.config.transactions().max_conflict_retries();

  for (std::uint32_t attempt = 0;; ++attempt) {
    deadline.Check(operation);
    try {
      auto tx = ctx.repository->Begin();
      if constexpr (std::is_void_v<ResultT>) {
        fn(*tx, deadline);
        deadline.Check(operation);
        tx->Commit();
        return;
      } else {
        ResultT result = fn(*tx, deadline);
        deadline.Check(operation);
        tx->Commit();
        return result;
      }
    } catch (const db::TransactionConflict& ex) {
      if (attempt >= max_retries) {
        throw util::TransactionAborted(std::string(operation) + ": gave up after " + std::to_string(attempt + 1) +
                                       " conflicting attempts; retry later (" + ex.what() + ")");
      }
      EDGESTORE_LOG_DEBUG("transaction conflict, retrying",
                          {observability::StringField("operation", operation), observability::IntField("attempt", attempt + 1)});
      std::this_thread::sleep_for(std::chrono::milliseconds(1u << std::min<std::uint32_t>(attempt, 6)));
    } catch (const util::Error&) {
      throw;
    } catch (const std::exception& ex) {
      EDGESTORE_LOG_ERROR("transaction failed", {observability::StringField("operation", operation), observability::StringField("error", ex.what())});
      throw util::TransactionAborted(std::string(operation) + ": storage failure; the transaction was rolled back");
    }
  }
}

template <typename Fn>
auto RunInTransaction(const ServiceContext& ctx, const OperationOptions& options, std::string_view operation, Fn&& fn) {
  return RunInTransactionUntil(ctx, ResolveDeadline(ctx, options), operation, std::forward<Fn>(fn));
}

} // namespace edgestore::service
