#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

#include "internal/util/json.hpp"

namespace edgestore::service {

enum class ChangeKind {
  kGlobalUpdate,
  kViewReady,
  kUpsert,
  kDelete,
};

// "global_update", "view_ready", "upsert", "delete"
const char* ChangeKindName(ChangeKind kind);

struct ChangeEvent {
  ChangeKind  kind = ChangeKind::kGlobalUpdate;
  std::string topic;
  // object carrying "type" plus the kind's identifying fields
  util::Json message;
};

std::string DatasetTopic(const std::string& dataset_id);
std::string ViewTopic(const std::string& dataset_id, const std::string& user_id);
std::string TableTopic(const std::string& user_id, const std::string& table_name);

ChangeEvent GlobalUpdateEvent(const std::string& dataset_id, const std::string& version);
ChangeEvent ViewReadyEvent(const std::string& dataset_id, const std::string& version, const std::string& user_id);
ChangeEvent UpsertEvent(const std::string& user_id, const std::string& table_name, const std::string& pk, std::int64_t updated_at,
                        const util::Json& item);
ChangeEvent DeleteEvent(const std::string& user_id, const std::string& table_name, const std::string& pk);

/*
  ChangeFeed

  In-process fan-out of committed changes. Services publish only after the
  owning transaction committed, so a subscriber never sees a rolled-back write.

  Topics:

      topic:<dataset>                 global_update
      topic:<dataset>:<user>          view_ready
      userdb:<user>:<table>           upsert, delete

  Handlers run on the publishing thread, outside the feed's lock; a handler
  may subscribe or unsubscribe. A handler that throws is logged and skipped.
*/
class ChangeFeed {
 public:
  using Handler        = std::function<void(const ChangeEvent&)>;
  using SubscriptionId = std::uint64_t;

  // An empty topic receives every event.
  SubscriptionId Subscribe(const std::string& topic, Handler handler);

  // Returns false for an unknown id.
  bool Unsubscribe(SubscriptionId id);

  void Publish(const ChangeEvent& event) const;

  std::size_t SubscriberCount() const;

 private:
  struct Subscription {
    std::string topic;
    Handler     handler;
  };

  mutable std::mutex                     mutex_;
  SubscriptionId                         next_id_ = 1;
  std::map<SubscriptionId, Subscription> subscriptions_;
};

} // namespace edgestore::service
