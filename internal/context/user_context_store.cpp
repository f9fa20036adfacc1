#include "user_context_store.hpp"

#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/service/db_errors.hpp"
#include "internal/service/observe.hpp"
#include "internal/service/transaction_runner.hpp"
#include "internal/util/errors.hpp"

namespace edgestore::context {

UserContextStore::UserContextStore(service::ServiceContext ctx) : ctx_(std::move(ctx)) {
}

void UserContextStore::SetContext(const std::string& user_id, const std::string& dataset_id, const util::Json& ctx, std::int64_t ts,
                                  const service::OperationOptions& options) {
  constexpr std::string_view kRoute = "UserContextStore.SetContext";
  service::ObserveOperation(kRoute, user_id, [&] {
    ctx_.RequireWriter(kRoute);
    if (user_id.empty() || dataset_id.empty()) {
      throw util::InvalidArgument(std::string(kRoute) + ": user_id and dataset_id must not be empty");
    }
    if (!util::IsObject(ctx)) {
      throw util::InvalidArgument(std::string(kRoute) + ": context must be a JSON object");
    }

    db::model::UserContextRecord record;
    record.user_id    = user_id;
    record.dataset_id = dataset_id;
    record.ctx        = util::ToJson(ctx);
    record.ts         = ts;

    service::RunInTransaction(ctx_, options, kRoute, [&](db::Transaction& tx, const util::Deadline&) {
      service::ThrowIfDbError(ctx_.repository->UpsertUserContext(tx, record), "upsert user context");
    });
  });
}

StoredContext UserContextStore::GetContext(const std::string& user_id, const std::string& dataset_id, const service::OperationOptions& options) {
  constexpr std::string_view kRoute = "UserContextStore.GetContext";
  return service::ObserveOperation(kRoute, user_id, [&] {
    auto record = service::RunInTransaction(ctx_, options, kRoute, [&](db::Transaction& tx, const util::Deadline&) {
      return ctx_.repository->GetUserContext(tx, user_id, dataset_id);
    });
    if (!record) {
      throw util::NotFound(std::string(kRoute) + ": no context for user '" + user_id + "' on dataset '" + dataset_id + "'");
    }
    return StoredContext{util::ParseJson(record->ctx), record->ts};
  });
}

} // namespace edgestore::context
