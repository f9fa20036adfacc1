#include "dataset_mirror.hpp"

#include <algorithm>
#include <utility>

#include "internal/db/api/repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/service/change_feed.hpp"
#include "internal/service/db_errors.hpp"
#include "internal/service/observe.hpp"
#include "internal/service/transaction_runner.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/hash.hpp"

namespace edgestore::mirror {

namespace {

constexpr std::size_t kMaxChecksumLength = 64;

void RequireNonEmpty(const std::string& value, const char* field, std::string_view operation) {
  if (value.empty()) {
    throw util::InvalidArgument(std::string(operation) + ": " + field + " must not be empty");
  }
}

VersionInfo ToInfo(const db::model::MirrorVersionRecord& record, std::uint64_t row_count) {
  VersionInfo info;
  info.dataset_id = record.dataset_id;
  info.version    = record.version;
  info.checksum   = record.checksum;
  info.ts         = record.ts;
  info.row_count  = row_count;
  return info;
}

} // namespace

// ---------------------------------------------------------------------------
// RowStream
// ---------------------------------------------------------------------------

RowStream::RowStream(service::ServiceContext ctx, std::string dataset_id, std::string version, std::size_t page_size,
                     std::optional<util::Deadline> deadline)
    : ctx_(std::move(ctx)),
      dataset_id_(std::move(dataset_id)),
      version_(std::move(version)),
      page_size_(std::max<std::size_t>(page_size, 1)),
      deadline_(std::move(deadline)) {
}

std::optional<util::Json> RowStream::Next() {
  if (pos_ >= page_.size()) {
    if (exhausted_) {
      return std::nullopt;
    }
    FetchPage();
    if (page_.empty()) {
      return std::nullopt;
    }
  }
  return util::ParseJson(page_[pos_++].item);
}

void RowStream::Restart() {
  page_.clear();
  pos_       = 0;
  after_id_  = 0;
  exhausted_ = false;
}

void RowStream::FetchPage() {
  constexpr std::string_view kRoute = "DatasetMirror.GetRows";
  auto read = [&](db::Transaction& tx, const util::Deadline&) { return ctx_.repository->ReadGlobalRows(tx, dataset_id_, version_, after_id_, page_size_); };
  page_     = deadline_ ? service::RunInTransactionUntil(ctx_, *deadline_, kRoute, read) : service::RunInTransaction(ctx_, {}, kRoute, read);
  pos_ = 0;
  if (page_.size() < page_size_) {
    exhausted_ = true;
  }
  if (!page_.empty()) {
    after_id_ = page_.back().id;
  }
}

// ---------------------------------------------------------------------------
// DatasetMirror
// ---------------------------------------------------------------------------

DatasetMirror::DatasetMirror(service::ServiceContext ctx) : ctx_(std::move(ctx)) {
}

std::string DatasetMirror::SnapshotChecksum(const std::vector<util::Json>& rows) {
  util::Json list;
  auto*      values = list.mutable_list_value();
  for (const auto& row : rows) {
    *values->add_values() = row;
  }
  return util::Sha256Hex(util::ToJson(list));
}

PublishResult DatasetMirror::PublishVersion(const std::string& dataset_id, const std::string& version, const std::string& checksum,
                                            const std::vector<util::Json>& rows, std::int64_t ts, const service::OperationOptions& options) {
  constexpr std::string_view kRoute = "DatasetMirror.PublishVersion";
  return service::ObserveOperation(kRoute, dataset_id, [&] {
    ctx_.RequireWriter(kRoute);
    RequireNonEmpty(dataset_id, "dataset_id", kRoute);
    RequireNonEmpty(version, "version", kRoute);
    RequireNonEmpty(checksum, "checksum", kRoute);
    if (checksum.size() > kMaxChecksumLength) {
      throw util::InvalidArgument(std::string(kRoute) + ": checksum exceeds 64 characters");
    }

    std::vector<std::string> items;
    items.reserve(rows.size());
    for (const auto& row : rows) {
      items.push_back(util::ToJson(row));
    }

    const bool        strict     = ctx_.config.mirror().reject_duplicate_versions();
    const std::size_t batch_size = std::max<std::size_t>(ctx_.config.mirror().insert_batch_size(), 1);

    auto result = service::RunInTransaction(ctx_, options, kRoute, [&](db::Transaction& tx, const util::Deadline& deadline) {
      auto& repo = *ctx_.repository;

      if (auto existing = repo.GetMirrorVersion(tx, dataset_id, version)) {
        if (existing->checksum != checksum) {
          throw util::ChecksumMismatch(std::string(kRoute) + ": " + dataset_id + "@" + version +
                                       " is already stored with a different checksum; publish under a new version");
        }
        if (strict) {
          throw util::DuplicateVersion(std::string(kRoute) + ": " + dataset_id + "@" + version + " is already published");
        }
        return PublishResult{false, repo.CountGlobalRows(tx, dataset_id, version)};
      }

      db::model::MirrorVersionRecord record;
      record.dataset_id = dataset_id;
      record.version    = version;
      record.checksum   = checksum;
      record.ts         = ts;

      auto inserted = repo.InsertMirrorVersion(tx, record);
      if (inserted.code == db::ErrorCode::AlreadyExists) {
        // a concurrent publisher won; the retry takes the existing-version path
        throw db::TransactionConflict("concurrent publish of " + dataset_id + "@" + version);
      }
      service::ThrowIfDbError(inserted, "insert dataset version");

      for (std::size_t offset = 0; offset < items.size(); offset += batch_size) {
        deadline.Check(kRoute);
        const auto end = std::min(items.size(), offset + batch_size);
        service::ThrowIfDbError(repo.InsertGlobalRows(tx, dataset_id, version, std::vector<std::string>(items.begin() + offset, items.begin() + end)),
                                "insert dataset rows");
      }
      return PublishResult{true, static_cast<std::uint64_t>(items.size())};
    });

    if (result.created) {
      observability::Metrics::Instance().AddMirroredRows(dataset_id, result.row_count);
      EDGESTORE_LOG_INFO("dataset version published", {observability::StringField("dataset_id", dataset_id),
                                                        observability::StringField("version", version),
                                                        observability::IntField("rows", static_cast<std::int64_t>(result.row_count))});
      ctx_.Announce(service::GlobalUpdateEvent(dataset_id, version));
    }
    return result;
  });
}

VersionInfo DatasetMirror::PublishSnapshot(const std::string& dataset_id, const std::vector<util::Json>& rows, const service::OperationOptions& options) {
  const auto ts       = ctx_.NowMs();
  const auto checksum = SnapshotChecksum(rows);
  const auto version  = "v" + std::to_string(ts) + "." + checksum.substr(0, 8);

  const auto result = PublishVersion(dataset_id, version, checksum, rows, ts, options);

  VersionInfo info;
  info.dataset_id = dataset_id;
  info.version    = version;
  info.checksum   = checksum;
  info.ts         = ts;
  info.row_count  = result.row_count;
  return info;
}

VersionInfo DatasetMirror::GetLatestVersion(const std::string& dataset_id, const service::OperationOptions& options) {
  constexpr std::string_view kRoute = "DatasetMirror.GetLatestVersion";
  return service::ObserveOperation(kRoute, dataset_id, [&] {
    return service::RunInTransaction(ctx_, options, kRoute, [&](db::Transaction& tx, const util::Deadline&) {
      auto latest = ctx_.repository->GetLatestMirrorVersion(tx, dataset_id);
      if (!latest) {
        throw util::NotFound(std::string(kRoute) + ": dataset '" + dataset_id + "' has no published version");
      }
      return ToInfo(*latest, ctx_.repository->CountGlobalRows(tx, dataset_id, latest->version));
    });
  });
}

VersionInfo DatasetMirror::GetVersion(const std::string& dataset_id, const std::string& version, const service::OperationOptions& options) {
  constexpr std::string_view kRoute = "DatasetMirror.GetVersion";
  return service::ObserveOperation(kRoute, dataset_id, [&] {
    return service::RunInTransaction(ctx_, options, kRoute, [&](db::Transaction& tx, const util::Deadline&) {
      auto record = ctx_.repository->GetMirrorVersion(tx, dataset_id, version);
      if (!record) {
        throw util::NotFound(std::string(kRoute) + ": " + dataset_id + "@" + version + " is not published");
      }
      return ToInfo(*record, ctx_.repository->CountGlobalRows(tx, dataset_id, version));
    });
  });
}

std::vector<VersionInfo> DatasetMirror::ListVersions(const std::string& dataset_id, std::size_t limit, const service::OperationOptions& options) {
  constexpr std::string_view kRoute = "DatasetMirror.ListVersions";
  return service::ObserveOperation(kRoute, dataset_id, [&] {
    return service::RunInTransaction(ctx_, options, kRoute, [&](db::Transaction& tx, const util::Deadline&) {
      std::vector<VersionInfo> out;
      for (const auto& record : ctx_.repository->ListMirrorVersions(tx, dataset_id, limit)) {
        out.push_back(ToInfo(record, ctx_.repository->CountGlobalRows(tx, dataset_id, record.version)));
      }
      return out;
    });
  });
}

RowStream DatasetMirror::GetRows(const std::string& dataset_id, const std::string& version, const service::OperationOptions& options) {
  constexpr std::string_view kRoute = "DatasetMirror.GetRows";
  return service::ObserveOperation(kRoute, dataset_id, [&] {
    std::optional<util::Deadline> deadline;
    if (options.timeout) {
      deadline = util::Deadline::After(*options.timeout);
    }
    service::RunInTransaction(ctx_, options, kRoute, [&](db::Transaction& tx, const util::Deadline&) {
      if (!ctx_.repository->GetMirrorVersion(tx, dataset_id, version)) {
        throw util::NotFound(std::string(kRoute) + ": " + dataset_id + "@" + version + " is not published");
      }
    });
    return RowStream(ctx_, dataset_id, version, ctx_.config.mirror().read_page_size(), std::move(deadline));
  });
}

} // namespace edgestore::mirror
