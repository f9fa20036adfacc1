#pragma once

#include <cstdint>
#include <string>

#include "internal/service/service_context.hpp"
#include "internal/util/json.hpp"

namespace edgestore::context {

struct StoredContext {
  util::Json   ctx;
  std::int64_t ts = 0;
};

/*
  Per-(user, dataset) context documents.

  SetContext is an unconditional upsert: the last call wins regardless of ts.
*/
class UserContextStore {
 public:
  explicit UserContextStore(service::ServiceContext ctx);

  // ctx must be a JSON object (InvalidArgument otherwise).
  void SetContext(const std::string& user_id, const std::string& dataset_id, const util::Json& ctx, std::int64_t ts,
                  const service::OperationOptions& options = {});

  // Throws NotFound when nothing was stored for the pair.
  StoredContext GetContext(const std::string& user_id, const std::string& dataset_id, const service::OperationOptions& options = {});

 private:
  service::ServiceContext ctx_;
};

} // namespace edgestore::context
