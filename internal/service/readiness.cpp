#include "readiness.hpp"

#include <stdexcept>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace edgestore::service {

ReadinessGate::ReadinessGate(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

bool ReadinessGate::IsReady() {
  if (ready_.load(std::memory_order_acquire)) {
    return true;
  }

  bool initialized = false;
  try {
    auto tx     = repository_->Begin();
    initialized = repository_->IsInitialized(*tx);
    tx->Commit();
  } catch (const std::runtime_error& ex) {
    // no schema yet reads the same as no marker
    EDGESTORE_LOG_DEBUG("readiness check failed", {observability::StringField("error", ex.what())});
    return false;
  }

  if (initialized) {
    ready_.store(true, std::memory_order_release);
  }
  return initialized;
}

void ReadinessGate::Require(std::string_view operation) {
  if (!IsReady()) {
    throw util::NotInitialized(std::string(operation) + ": store is not initialized; wait for schema provisioning to complete");
  }
}

} // namespace edgestore::service
