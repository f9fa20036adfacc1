#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/model/mirror_record.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/deadline.hpp"
#include "internal/util/json.hpp"

namespace edgestore::mirror {

struct PublishResult {
  // false when an identical version was already stored
  bool          created   = false;
  std::uint64_t row_count = 0;
};

struct VersionInfo {
  std::string   dataset_id;
  std::string   version;
  std::string   checksum;
  std::int64_t  ts        = 0;
  std::uint64_t row_count = 0;
};

/*
  Lazy, restartable sequence of the rows of one published version.

  Rows are fetched in pages, each page in its own short read transaction.
  Versions are immutable, so pages never observe a partial version and a
  restarted stream yields the same rows again. A timeout given to GetRows
  bounds every page fetch of the stream, Restart included.
*/
class RowStream {
 public:
  // nullopt once every row has been returned
  std::optional<util::Json> Next();

  // Rewinds to the first row.
  void Restart();

  const std::string& DatasetId() const {
    return dataset_id_;
  }
  const std::string& Version() const {
    return version_;
  }

 private:
  friend class DatasetMirror;

  RowStream(service::ServiceContext ctx, std::string dataset_id, std::string version, std::size_t page_size,
            std::optional<util::Deadline> deadline);

  void FetchPage();

  service::ServiceContext                 ctx_;
  std::string                             dataset_id_;
  std::string                             version_;
  std::size_t                             page_size_;
  std::optional<util::Deadline>           deadline_;
  std::vector<db::model::GlobalRowRecord> page_;
  std::size_t                             pos_       = 0;
  std::uint64_t                           after_id_  = 0;
  bool                                    exhausted_ = false;
};

/*
  DatasetMirror

  Immutable, checksum-verified versions of global datasets.

  - a version and all of its rows are written in one transaction
  - re-publishing with the same checksum is idempotent (or DuplicateVersion
    in strict mode); a different checksum is ChecksumMismatch
  - the latest version is the greatest ts, ties broken by insertion order
*/
class DatasetMirror {
 public:
  explicit DatasetMirror(service::ServiceContext ctx);

  PublishResult PublishVersion(const std::string& dataset_id, const std::string& version, const std::string& checksum,
                               const std::vector<util::Json>& rows, std::int64_t ts, const service::OperationOptions& options = {});

  // checksum = sha256(canonical JSON of rows), version = "v{ts}.{checksum[0:8]}", ts = now
  VersionInfo PublishSnapshot(const std::string& dataset_id, const std::vector<util::Json>& rows, const service::OperationOptions& options = {});

  VersionInfo GetLatestVersion(const std::string& dataset_id, const service::OperationOptions& options = {});
  VersionInfo GetVersion(const std::string& dataset_id, const std::string& version, const service::OperationOptions& options = {});

  // newest first; limit 0 = all
  std::vector<VersionInfo> ListVersions(const std::string& dataset_id, std::size_t limit = 0, const service::OperationOptions& options = {});

  // Throws NotFound when the version does not exist.
  RowStream GetRows(const std::string& dataset_id, const std::string& version, const service::OperationOptions& options = {});

  static std::string SnapshotChecksum(const std::vector<util::Json>& rows);

 private:
  service::ServiceContext ctx_;
};

} // namespace edgestore::mirror
