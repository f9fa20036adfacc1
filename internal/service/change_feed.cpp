#include "change_feed.hpp"

#include <exception>
#include <utility>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace edgestore::service {

namespace {

ChangeEvent MakeEvent(ChangeKind kind, std::string topic) {
  ChangeEvent event;
  event.kind    = kind;
  event.topic   = std::move(topic);
  event.message = util::JsonObject();
  (*event.message.mutable_struct_value()->mutable_fields())["type"] = util::JsonString(ChangeKindName(kind));
  return event;
}

void SetField(ChangeEvent& event, const std::string& key, util::Json value) {
  (*event.message.mutable_struct_value()->mutable_fields())[key] = std::move(value);
}

} // namespace

const char* ChangeKindName(ChangeKind kind) {
  switch (kind) {
    case ChangeKind::kGlobalUpdate:
      return "global_update";
    case ChangeKind::kViewReady:
      return "view_ready";
    case ChangeKind::kUpsert:
      return "upsert";
    case ChangeKind::kDelete:
      return "delete";
  }
  return "unknown";
}

std::string DatasetTopic(const std::string& dataset_id) {
  return "topic:" + dataset_id;
}

std::string ViewTopic(const std::string& dataset_id, const std::string& user_id) {
  return "topic:" + dataset_id + ":" + user_id;
}

std::string TableTopic(const std::string& user_id, const std::string& table_name) {
  return "userdb:" + user_id + ":" + table_name;
}

ChangeEvent GlobalUpdateEvent(const std::string& dataset_id, const std::string& version) {
  auto event = MakeEvent(ChangeKind::kGlobalUpdate, DatasetTopic(dataset_id));
  SetField(event, "dataset_id", util::JsonString(dataset_id));
  SetField(event, "version", util::JsonString(version));
  return event;
}

ChangeEvent ViewReadyEvent(const std::string& dataset_id, const std::string& version, const std::string& user_id) {
  auto event = MakeEvent(ChangeKind::kViewReady, ViewTopic(dataset_id, user_id));
  SetField(event, "dataset_id", util::JsonString(dataset_id));
  SetField(event, "version", util::JsonString(version));
  SetField(event, "user_id", util::JsonString(user_id));
  return event;
}

ChangeEvent UpsertEvent(const std::string& user_id, const std::string& table_name, const std::string& pk, std::int64_t updated_at,
                        const util::Json& item) {
  auto event = MakeEvent(ChangeKind::kUpsert, TableTopic(user_id, table_name));
  SetField(event, "user_id", util::JsonString(user_id));
  SetField(event, "table", util::JsonString(table_name));
  SetField(event, "pk", util::JsonString(pk));
  SetField(event, "updated_at", util::JsonNumber(static_cast<double>(updated_at)));
  SetField(event, "item", item);
  return event;
}

ChangeEvent DeleteEvent(const std::string& user_id, const std::string& table_name, const std::string& pk) {
  auto event = MakeEvent(ChangeKind::kDelete, TableTopic(user_id, table_name));
  SetField(event, "user_id", util::JsonString(user_id));
  SetField(event, "table", util::JsonString(table_name));
  SetField(event, "pk", util::JsonString(pk));
  return event;
}

ChangeFeed::SubscriptionId ChangeFeed::Subscribe(const std::string& topic, Handler handler) {
  if (!handler) {
    throw util::InvalidArgument("subscribe: handler is required");
  }
  std::lock_guard lock(mutex_);
  const auto      id = next_id_++;
  subscriptions_.emplace(id, Subscription{topic, std::move(handler)});
  return id;
}

bool ChangeFeed::Unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  return subscriptions_.erase(id) > 0;
}

void ChangeFeed::Publish(const ChangeEvent& event) const {
  std::vector<Handler> targets;
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, subscription] : subscriptions_) {
      if (subscription.topic.empty() || subscription.topic == event.topic) {
        targets.push_back(subscription.handler);
      }
    }
  }

  for (const auto& handler : targets) {
    try {
      handler(event);
    } catch (const std::exception& ex) {
      EDGESTORE_LOG_WARN("change subscriber failed", {observability::StringField("topic", event.topic),
                                                      observability::StringField("type", ChangeKindName(event.kind)),
                                                      observability::StringField("error", ex.what())});
    }
  }
}

std::size_t ChangeFeed::SubscriberCount() const {
  std::lock_guard lock(mutex_);
  return subscriptions_.size();
}

} // namespace edgestore::service
