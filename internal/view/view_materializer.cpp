#include "view_materializer.hpp"

#include <algorithm>
#include <cstddef>
#include <map>
#include <stdexcept>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/change_feed.hpp"
#include "internal/service/db_errors.hpp"
#include "internal/service/observe.hpp"
#include "internal/service/transaction_runner.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json_path.hpp"

namespace edgestore::view {

namespace {

std::size_t PageSize(const service::ServiceContext& ctx) {
  return std::max<std::size_t>(ctx.config.views().read_page_size(), 1);
}

ViewEntry ToEntry(const db::model::UserViewRecord& record) {
  ViewEntry entry;
  entry.id      = record.id;
  entry.version = record.version;
  entry.item    = util::ParseJson(record.item);
  entry.ts      = record.ts;
  return entry;
}

} // namespace

// ---------------------------------------------------------------------------
// ViewStream
// ---------------------------------------------------------------------------

ViewStream::ViewStream(service::ServiceContext ctx, db::model::UserViewQuery query, std::optional<util::Deadline> deadline)
    : ctx_(std::move(ctx)), query_(std::move(query)), deadline_(std::move(deadline)) {
}

std::optional<ViewEntry> ViewStream::Next() {
  if (pos_ >= page_.size()) {
    if (exhausted_) {
      return std::nullopt;
    }
    FetchPage();
    if (page_.empty()) {
      return std::nullopt;
    }
  }
  return ToEntry(page_[pos_++]);
}

void ViewStream::FetchPage() {
  constexpr std::string_view kRoute = "ViewMaterializer.GetView";
  auto read = [&](db::Transaction& tx, const util::Deadline&) { return ctx_.repository->ReadUserViews(tx, query_); };
  page_     = deadline_ ? service::RunInTransactionUntil(ctx_, *deadline_, kRoute, read) : service::RunInTransaction(ctx_, {}, kRoute, read);
  pos_ = 0;
  if (page_.size() < query_.limit) {
    exhausted_ = true;
  }
  if (!page_.empty()) {
    query_.after_id = page_.back().id;
  }
}

// ---------------------------------------------------------------------------
// ViewMaterializer
// ---------------------------------------------------------------------------

ViewMaterializer::ViewMaterializer(service::ServiceContext ctx, std::shared_ptr<TransformRegistry> transforms)
    : ctx_(std::move(ctx)), transforms_(std::move(transforms)) {
  if (!transforms_) {
    throw std::invalid_argument("ViewMaterializer requires a transform registry");
  }
}

MaterializeResult ViewMaterializer::MaterializeView(const std::string& user_id, const std::string& dataset_id,
                                                    const service::OperationOptions& options) {
  constexpr std::string_view kRoute = "ViewMaterializer.MaterializeView";
  return service::ObserveOperation(kRoute, user_id, [&] {
    ctx_.RequireWriter(kRoute);
    if (user_id.empty() || dataset_id.empty()) {
      throw util::InvalidArgument(std::string(kRoute) + ": user_id and dataset_id must not be empty");
    }

    const auto        transform = transforms_->Resolve(dataset_id);
    const std::size_t page_size = PageSize(ctx_);

    auto result = service::RunInTransaction(ctx_, options, kRoute, [&](db::Transaction& tx, const util::Deadline& deadline) {
      auto& repo = *ctx_.repository;

      const auto pinned = repo.GetLatestMirrorVersion(tx, dataset_id);
      if (!pinned) {
        throw util::NotFound(std::string(kRoute) + ": dataset '" + dataset_id + "' has no published version");
      }

      util::Json context = util::JsonObject();
      if (auto stored = repo.GetUserContext(tx, user_id, dataset_id)) {
        context = util::ParseJson(stored->ctx);
      }

      MaterializeResult out{pinned->version, pinned->checksum, 0};
      const auto        ts = ctx_.NowMs();

      const auto append = [&](std::vector<util::Json>::const_iterator first, std::vector<util::Json>::const_iterator last) {
        if (first == last) {
          return;
        }
        std::vector<db::model::UserViewRecord> batch;
        batch.reserve(static_cast<std::size_t>(last - first));
        for (auto it = first; it != last; ++it) {
          db::model::UserViewRecord record;
          record.user_id    = user_id;
          record.dataset_id = dataset_id;
          record.version    = pinned->version;
          record.item       = util::ToJson(*it);
          record.ts         = ts;
          batch.push_back(std::move(record));
        }
        service::ThrowIfDbError(repo.AppendUserViews(tx, batch), "append user views");
        out.appended += batch.size();
      };

      // an ordered transform sees every item of the version before any is appended
      std::vector<util::Json> items;
      std::uint64_t           after_id = 0;
      for (;;) {
        deadline.Check(kRoute);
        const auto rows = repo.ReadGlobalRows(tx, dataset_id, pinned->version, after_id, page_size);

        for (const auto& row : rows) {
          if (auto item = transform.map(util::ParseJson(row.item), context)) {
            items.push_back(std::move(*item));
          }
        }
        if (!transform.order) {
          append(items.cbegin(), items.cend());
          items.clear();
        }

        if (rows.size() < page_size) {
          break;
        }
        after_id = rows.back().id;
      }

      if (transform.order) {
        transform.order(items, context);
        for (std::size_t offset = 0; offset < items.size(); offset += page_size) {
          deadline.Check(kRoute);
          const auto end = std::min(items.size(), offset + page_size);
          append(items.cbegin() + static_cast<std::ptrdiff_t>(offset), items.cbegin() + static_cast<std::ptrdiff_t>(end));
        }
      }
      return out;
    });

    observability::Metrics::Instance().AddViewRows(dataset_id, result.appended);
    EDGESTORE_LOG_INFO("view materialized", {observability::StringField("user_id", user_id), observability::StringField("dataset_id", dataset_id),
                                             observability::StringField("version", result.version),
                                             observability::IntField("appended", static_cast<std::int64_t>(result.appended))});
    ctx_.Announce(service::ViewReadyEvent(dataset_id, result.version, user_id));
    return result;
  });
}

ViewStream ViewMaterializer::GetView(const std::string& user_id, const std::string& dataset_id, const std::string& version, std::int64_t since_ts,
                                     const service::OperationOptions& options) {
  constexpr std::string_view kRoute = "ViewMaterializer.GetView";
  return service::ObserveOperation(kRoute, user_id, [&] {
    std::optional<util::Deadline> deadline;
    if (options.timeout) {
      deadline = util::Deadline::After(*options.timeout);
    }
    // surfaces NotInitialized and the deadline before the first page
    service::RunInTransaction(ctx_, options, kRoute, [](db::Transaction&, const util::Deadline&) {});

    db::model::UserViewQuery query;
    query.user_id    = user_id;
    query.dataset_id = dataset_id;
    query.version    = version;
    query.since_ts   = since_ts;
    query.limit      = PageSize(ctx_);
    return ViewStream(ctx_, std::move(query), std::move(deadline));
  });
}

std::vector<ViewEntry> ViewMaterializer::LatestPerKey(const std::string& user_id, const std::string& dataset_id, const std::string& version,
                                                      const std::string& key_path, const service::OperationOptions& options) {
  constexpr std::string_view kRoute = "ViewMaterializer.LatestPerKey";
  return service::ObserveOperation(kRoute, user_id, [&] {
    const auto path = util::JsonPath::Parse(key_path);

    auto stream = GetView(user_id, dataset_id, version, 0, options);

    // log order is append order, so >= lets the later append win a ts tie
    std::map<std::string, ViewEntry> latest;
    while (auto entry = stream.Next()) {
      const auto* key = path.Resolve(entry->item);
      if (!key || key->kind_case() == util::Json::kNullValue) {
        continue;
      }
      const auto text = key->kind_case() == util::Json::kStringValue ? key->string_value() : util::ToJson(*key);
      auto       it   = latest.find(text);
      if (it == latest.end()) {
        latest.emplace(text, std::move(*entry));
      } else if (entry->ts >= it->second.ts) {
        it->second = std::move(*entry);
      }
    }

    std::vector<ViewEntry> out;
    out.reserve(latest.size());
    for (auto& [key, entry] : latest) {
      out.push_back(std::move(entry));
    }
    return out;
  });
}

} // namespace edgestore::view
