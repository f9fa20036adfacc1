#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/view_record.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/deadline.hpp"
#include "internal/util/json.hpp"
#include "internal/view/transform_registry.hpp"

namespace edgestore::view {

struct MaterializeResult {
  std::string   version;
  std::string   checksum;
  std::uint64_t appended = 0;
};

struct ViewEntry {
  std::uint64_t id = 0;
  std::string   version;
  util::Json    item;
  std::int64_t  ts = 0;
};

// Lazy sequence over the view log in append order. A timeout given to
// GetView bounds every page fetch.
class ViewStream {
 public:
  std::optional<ViewEntry> Next();

 private:
  friend class ViewMaterializer;

  ViewStream(service::ServiceContext ctx, db::model::UserViewQuery query, std::optional<util::Deadline> deadline);

  void FetchPage();

  service::ServiceContext                ctx_;
  db::model::UserViewQuery               query_;
  std::optional<util::Deadline>          deadline_;
  std::vector<db::model::UserViewRecord> page_;
  std::size_t                            pos_       = 0;
  bool                                   exhausted_ = false;
};

/*
  ViewMaterializer

  Derives per-user views from the latest dataset version and the user's
  context and appends them to the view log.

  - one call pins one version for its whole run (single transaction)
  - the log is append-only; repeated runs append duplicates
  - latest-per-key is a read over the log, never a rewrite of it
*/
class ViewMaterializer {
 public:
  ViewMaterializer(service::ServiceContext ctx, std::shared_ptr<TransformRegistry> transforms);

  // NotFound when the dataset has no published version.
  MaterializeResult MaterializeView(const std::string& user_id, const std::string& dataset_id, const service::OperationOptions& options = {});

  // Entries with ts >= since_ts; an empty version matches every version.
  ViewStream GetView(const std::string& user_id, const std::string& dataset_id, const std::string& version, std::int64_t since_ts,
                     const service::OperationOptions& options = {});

  // Newest entry per distinct value at key_path (max ts, ties to the later
  // append), ordered by key. Entries without the key are skipped.
  std::vector<ViewEntry> LatestPerKey(const std::string& user_id, const std::string& dataset_id, const std::string& version,
                                      const std::string& key_path, const service::OperationOptions& options = {});

 private:
  service::ServiceContext            ctx_;
  std::shared_ptr<TransformRegistry> transforms_;
};

} // namespace edgestore::view
