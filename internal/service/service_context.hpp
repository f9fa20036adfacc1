#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string_view>

#include "config/config.pb.h"
#include "internal/auth/capability.hpp"

namespace edgestore::db {
class Repository;
}

namespace edgestore::service {

class ReadinessGate;
class ChangeFeed;
struct ChangeEvent;

// Per-call knobs; an unset timeout falls back to transactions.default_timeout_ms.
struct OperationOptions {
  std::optional<std::chrono::milliseconds> timeout;
};

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<edgestore::db::Repository> repository;
  std::shared_ptr<ReadinessGate>             readiness;
  edgestore::auth::Capability                capability = edgestore::auth::Capability::kWriter;
  edgestore::runtime::config::RuntimeConfig  config;
  // null: committed changes are not announced
  std::shared_ptr<ChangeFeed> changes;

  // wall clock in epoch ms; replaceable in tests
  std::function<std::int64_t()> now_ms;

  std::int64_t NowMs() const;

  // Throws Unauthorized under the reader capability.
  void RequireWriter(std::string_view operation) const;

  // Call only after the change committed.
  void Announce(const ChangeEvent& event) const;
};

} // namespace edgestore::service
