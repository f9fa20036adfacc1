#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/mirror/dataset_mirror.hpp"
#include "internal/service/readiness.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"

namespace {

using edgestore::mirror::DatasetMirror;
using edgestore::service::ServiceContext;
using edgestore::util::Json;
using edgestore::util::ParseJson;

struct Harness {
  std::shared_ptr<edgestore::db::memory::MemoryRepository> repo = std::make_shared<edgestore::db::memory::MemoryRepository>();
  edgestore::runtime::config::RuntimeConfig                  config = edgestore::config::ConfigLoader::LoadFromString("");
  std::int64_t                                               now    = 1000;

  Harness() {
    auto       tx     = repo->Begin();
    const auto marked = repo->MarkInitialized(*tx, 1);
    assert(marked);
    tx->Commit();
  }

  DatasetMirror Mirror() {
    ServiceContext ctx;
    ctx.repository = repo;
    ctx.readiness  = std::make_shared<edgestore::service::ReadinessGate>(repo);
    ctx.config     = config;
    ctx.now_ms     = [this] { return now; };
    return DatasetMirror(ctx);
  }
};

std::vector<Json> Rows(std::initializer_list<const char*> texts) {
  std::vector<Json> rows;
  for (const char* text : texts) {
    rows.push_back(ParseJson(text));
  }
  return rows;
}

std::vector<std::string> Drain(edgestore::mirror::RowStream& stream) {
  std::vector<std::string> out;
  while (auto row = stream.Next()) {
    out.push_back(edgestore::util::ToJson(*row));
  }
  return out;
}

void TestPublishAndRead() {
  Harness h;
  auto    mirror = h.Mirror();

  const auto result = mirror.PublishVersion("catalog", "v1", "abc123", Rows({R"({"sku":"A1"})", R"({"sku":"A2"})"}), 1000);
  assert(result.created);
  assert(result.row_count == 2);

  const auto latest = mirror.GetLatestVersion("catalog");
  assert(latest.version == "v1");
  assert(latest.checksum == "abc123");
  assert(latest.ts == 1000);
  assert(latest.row_count == 2);

  auto stream = mirror.GetRows("catalog", "v1");
  const auto rows = Drain(stream);
  assert((rows == std::vector<std::string>{R"({"sku":"A1"})", R"({"sku":"A2"})"}));

  // restartable
  stream.Restart();
  assert(Drain(stream) == rows);
}

void TestRepublishIsIdempotentAndChecksumIsVerified() {
  Harness h;
  auto    mirror = h.Mirror();

  assert(mirror.PublishVersion("catalog", "v1", "abc123", Rows({R"({"sku":"A1"})"}), 1000).created);

  const auto again = mirror.PublishVersion("catalog", "v1", "abc123", Rows({R"({"sku":"A1"})"}), 1000);
  assert(!again.created);
  assert(again.row_count == 1);

  bool mismatch = false;
  try {
    mirror.PublishVersion("catalog", "v1", "def456", Rows({R"({"sku":"B1"})"}), 2000);
  } catch (const edgestore::util::ChecksumMismatch&) {
    mismatch = true;
  }
  assert(mismatch);

  auto stream = mirror.GetRows("catalog", "v1");
  assert((Drain(stream) == std::vector<std::string>{R"({"sku":"A1"})"}));
}

void TestStrictModeRejectsDuplicates() {
  Harness h;
  h.config.mutable_mirror()->set_reject_duplicate_versions(true);
  auto mirror = h.Mirror();

  mirror.PublishVersion("catalog", "v1", "abc123", {}, 1000);

  bool duplicate = false;
  try {
    mirror.PublishVersion("catalog", "v1", "abc123", {}, 1000);
  } catch (const edgestore::util::DuplicateVersion&) {
    duplicate = true;
  }
  assert(duplicate);
}

void TestLatestIsGreatestTsThenInsertionOrder() {
  Harness h;
  auto    mirror = h.Mirror();

  mirror.PublishVersion("catalog", "v1", "c1", {}, 1000);
  mirror.PublishVersion("catalog", "v0", "c0", {}, 500);
  assert(mirror.GetLatestVersion("catalog").version == "v1");

  mirror.PublishVersion("catalog", "v2", "c2", {}, 1000);
  assert(mirror.GetLatestVersion("catalog").version == "v2");

  const auto versions = mirror.ListVersions("catalog");
  assert(versions.size() == 3);
  assert(versions[0].version == "v2");
  assert(versions[1].version == "v1");
  assert(versions[2].version == "v0");

  const auto limited = mirror.ListVersions("catalog", 1);
  assert(limited.size() == 1 && limited[0].version == "v2");

  // datasets are independent
  bool not_found = false;
  try {
    mirror.GetLatestVersion("other");
  } catch (const edgestore::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
}

void TestBatchedInsertAndPagedRead() {
  Harness h;
  h.config.mutable_mirror()->set_insert_batch_size(2);
  h.config.mutable_mirror()->set_read_page_size(2);
  auto mirror = h.Mirror();

  std::vector<Json> rows;
  for (int i = 0; i < 5; ++i) {
    rows.push_back(ParseJson("{\"n\":" + std::to_string(i) + "}"));
  }
  assert(mirror.PublishVersion("numbers", "v1", "n5", rows, 10).row_count == 5);
  assert(mirror.GetVersion("numbers", "v1").row_count == 5);

  auto       stream = mirror.GetRows("numbers", "v1");
  const auto read   = Drain(stream);
  assert(read.size() == 5);
  for (int i = 0; i < 5; ++i) {
    assert(read[i] == "{\"n\":" + std::to_string(i) + "}");
  }
}

void TestSnapshotDerivesVersionAndChecksum() {
  Harness h;
  h.now       = 1700000000000;
  auto mirror = h.Mirror();

  const auto rows = Rows({R"({"sku":"A1"})", R"({"sku":"A2"})"});
  const auto info = mirror.PublishSnapshot("catalog", rows);
  assert(info.checksum == DatasetMirror::SnapshotChecksum(rows));
  assert(info.checksum.size() == 64);
  assert(info.version == "v1700000000000." + info.checksum.substr(0, 8));
  assert(info.ts == 1700000000000);
  assert(info.row_count == 2);
  assert(mirror.GetLatestVersion("catalog").version == info.version);

  // row order is part of the snapshot identity
  assert(DatasetMirror::SnapshotChecksum(Rows({R"({"sku":"A2"})", R"({"sku":"A1"})"})) != info.checksum);
}

void TestValidationAndMissingVersions() {
  Harness h;
  auto    mirror = h.Mirror();

  bool invalid = false;
  try {
    mirror.PublishVersion("", "v1", "abc", {}, 1);
  } catch (const edgestore::util::InvalidArgument&) {
    invalid = true;
  }
  assert(invalid);

  invalid = false;
  try {
    mirror.PublishVersion("catalog", "v1", std::string(65, 'a'), {}, 1);
  } catch (const edgestore::util::InvalidArgument&) {
    invalid = true;
  }
  assert(invalid);

  bool not_found = false;
  try {
    mirror.GetRows("catalog", "v9");
  } catch (const edgestore::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
}

void TestStreamTimeoutCoversLaterPages() {
  Harness h;
  h.config.mutable_mirror()->set_read_page_size(1);
  auto mirror = h.Mirror();
  mirror.PublishVersion("catalog", "v1", "abc123", Rows({R"({"sku":"A1"})", R"({"sku":"A2"})", R"({"sku":"A3"})"}), 1000);

  edgestore::service::OperationOptions options;
  options.timeout = std::chrono::milliseconds(40);
  auto stream     = mirror.GetRows("catalog", "v1", options);
  assert(stream.Next().has_value());

  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  bool aborted = false;
  try {
    stream.Next();
  } catch (const edgestore::util::TransactionAborted&) {
    aborted = true;
  }
  assert(aborted);

  // without a timeout every page gets the default budget
  auto unbounded = mirror.GetRows("catalog", "v1");
  assert(unbounded.Next().has_value());
  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  assert(Drain(unbounded).size() == 2);
}

} // namespace

int main() {
  TestPublishAndRead();
  TestRepublishIsIdempotentAndChecksumIsVerified();
  TestStrictModeRejectsDuplicates();
  TestLatestIsGreatestTsThenInsertionOrder();
  TestBatchedInsertAndPagedRead();
  TestSnapshotDerivesVersionAndChecksum();
  TestValidationAndMissingVersions();
  TestStreamTimeoutCoversLaterPages();

  std::cout << "edgestore_unit_dataset_mirror: pass\n";
  return 0;
}
