#pragma once

#include <atomic>
#include <memory>
#include <string_view>

namespace edgestore::db {
class Repository;
}

namespace edgestore::service {

/*
  Gate on the init_complete marker.

  The marker is written once by schema provisioning and never removed, so a
  positive answer is cached for the life of the process.
*/
class ReadinessGate {
 public:
  explicit ReadinessGate(std::shared_ptr<edgestore::db::Repository> repository);

  bool IsReady();

  // Throws NotInitialized while the marker is absent.
  void Require(std::string_view operation);

 private:
  std::shared_ptr<edgestore::db::Repository> repository_;
  std::atomic<bool>                          ready_{false};
};

} // namespace edgestore::service
