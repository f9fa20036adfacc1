#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/context/user_context_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/mirror/dataset_mirror.hpp"
#include "internal/service/readiness.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/view/transform_registry.hpp"
#include "internal/view/view_materializer.hpp"

namespace {

using edgestore::util::Json;
using edgestore::util::ParseJson;
using edgestore::util::ToJson;
using edgestore::view::TransformRegistry;
using edgestore::view::ViewEntry;
using edgestore::view::ViewMaterializer;

struct Harness {
  std::shared_ptr<edgestore::db::memory::MemoryRepository> repo = std::make_shared<edgestore::db::memory::MemoryRepository>();
  std::shared_ptr<TransformRegistry>                         transforms = std::make_shared<TransformRegistry>();
  edgestore::runtime::config::RuntimeConfig                  config     = edgestore::config::ConfigLoader::LoadFromString("");
  std::int64_t                                               now        = 5000;

  Harness() {
    auto       tx     = repo->Begin();
    const auto marked = repo->MarkInitialized(*tx, 1);
    assert(marked);
    tx->Commit();
  }

  edgestore::service::ServiceContext Context() {
    edgestore::service::ServiceContext ctx;
    ctx.repository = repo;
    ctx.readiness  = std::make_shared<edgestore::service::ReadinessGate>(repo);
    ctx.config     = config;
    ctx.now_ms     = [this] { return now; };
    return ctx;
  }

  edgestore::mirror::DatasetMirror Mirror() {
    return edgestore::mirror::DatasetMirror(Context());
  }
  edgestore::context::UserContextStore Contexts() {
    return edgestore::context::UserContextStore(Context());
  }
  ViewMaterializer Views() {
    return ViewMaterializer(Context(), transforms);
  }
};

std::vector<Json> Rows(std::initializer_list<const char*> texts) {
  std::vector<Json> rows;
  for (const char* text : texts) {
    rows.push_back(ParseJson(text));
  }
  return rows;
}

std::vector<ViewEntry> Drain(edgestore::view::ViewStream stream) {
  std::vector<ViewEntry> out;
  while (auto entry = stream.Next()) {
    out.push_back(std::move(*entry));
  }
  return out;
}

void TestMaterializeMergesContext() {
  Harness h;
  h.Mirror().PublishVersion("catalog", "v1", "abc123", Rows({R"({"sku":"A1"})", R"({"sku":"A2"})"}), 1000);
  h.Contexts().SetContext("u1", "catalog", ParseJson(R"({"region":"EU"})"), 1000);

  auto       views  = h.Views();
  const auto result = views.MaterializeView("u1", "catalog");
  assert(result.version == "v1");
  assert(result.checksum == "abc123");
  assert(result.appended == 2);

  const auto entries = Drain(views.GetView("u1", "catalog", "v1", 0));
  assert(entries.size() == 2);
  assert(ToJson(entries[0].item) == R"({"region":"EU","sku":"A1"})");
  assert(ToJson(entries[1].item) == R"({"region":"EU","sku":"A2"})");
  for (const auto& entry : entries) {
    assert(entry.version == "v1");
    assert(entry.ts == 5000);
  }
}

void TestMissingContextAndRepeatedRuns() {
  Harness h;
  h.Mirror().PublishVersion("catalog", "v1", "abc123", Rows({R"({"sku":"A1"})"}), 1000);

  auto views = h.Views();
  assert(views.MaterializeView("u1", "catalog").appended == 1);
  h.now = 6000;
  assert(views.MaterializeView("u1", "catalog").appended == 1);

  // the log keeps both runs; since_ts selects the second
  assert(Drain(views.GetView("u1", "catalog", "v1", 0)).size() == 2);
  const auto recent = Drain(views.GetView("u1", "catalog", "", 6000));
  assert(recent.size() == 1);
  assert(ToJson(recent[0].item) == R"({"sku":"A1"})");

  // other users see nothing
  assert(Drain(views.GetView("u2", "catalog", "", 0)).empty());
}

void TestMaterializePinsLatestVersion() {
  Harness h;
  auto    mirror = h.Mirror();
  mirror.PublishVersion("catalog", "v1", "c1", Rows({R"({"sku":"A1"})"}), 1000);
  mirror.PublishVersion("catalog", "v2", "c2", Rows({R"({"sku":"B1"})", R"({"sku":"B2"})"}), 2000);

  auto       views  = h.Views();
  const auto result = views.MaterializeView("u1", "catalog");
  assert(result.version == "v2");
  assert(result.appended == 2);
  assert(Drain(views.GetView("u1", "catalog", "v1", 0)).empty());
  assert(Drain(views.GetView("u1", "catalog", "v2", 0)).size() == 2);
}

void TestNoPublishedVersion() {
  Harness h;
  bool    not_found = false;
  try {
    h.Views().MaterializeView("u1", "catalog");
  } catch (const edgestore::util::NotFound&) {
    not_found = true;
  }
  assert(not_found);
}

void TestFilterContextDropsRows() {
  Harness h;
  h.transforms->Assign("catalog", edgestore::view::kFilterContext);
  h.Mirror().PublishVersion("catalog", "v1", "c1",
                            Rows({R"({"sku":"A1","region":"EU","tier":"gold"})", R"({"sku":"A2","region":"US","tier":"gold"})",
                                  R"({"sku":"A3","region":"EU","tier":"basic"})", R"({"sku":"A4","region":"APAC","tier":"gold"})"}),
                            1000);
  h.Contexts().SetContext("u1", "catalog", ParseJson(R"({"filters":{"region":["EU","APAC"],"tier":"gold"}})"), 1);

  auto       views  = h.Views();
  const auto result = views.MaterializeView("u1", "catalog");
  assert(result.appended == 2);

  const auto entries = Drain(views.GetView("u1", "catalog", "v1", 0));
  assert(entries.size() == 2);
  assert(entries[0].item.struct_value().fields().at("sku").string_value() == "A1");
  assert(entries[1].item.struct_value().fields().at("sku").string_value() == "A4");
}

void TestFilterContextSortsTheLog() {
  Harness h;
  h.config.mutable_views()->set_read_page_size(2);
  h.transforms->Assign("catalog", edgestore::view::kFilterContext);
  h.Mirror().PublishVersion("catalog", "v1", "c1",
                            Rows({R"({"sku":"A1","price":3,"tier":"gold"})", R"({"sku":"A2","price":1,"tier":"gold"})", R"({"sku":"A3","tier":"gold"})",
                                  R"({"sku":"A4","price":5,"tier":"gold"})", R"({"sku":"A5","price":null,"tier":"gold"})",
                                  R"({"sku":"A6","price":2,"tier":"gold"})", R"({"sku":"A7","price":4,"tier":"basic"})"}),
                            1000);
  h.Contexts().SetContext("u1", "catalog", ParseJson(R"({"filters":{"tier":"gold"},"sort":{"by":"price","desc":true}})"), 1);
  h.Contexts().SetContext("u2", "catalog", ParseJson(R"({"sort":{"by":"price"}})"), 1);
  h.Contexts().SetContext("u3", "catalog", ParseJson(R"({"sort":{"by":7}})"), 1);

  const auto skus = [](const std::vector<ViewEntry>& entries) {
    std::vector<std::string> out;
    for (const auto& entry : entries) {
      out.push_back(entry.item.struct_value().fields().at("sku").string_value());
    }
    return out;
  };

  auto views = h.Views();
  assert(views.MaterializeView("u1", "catalog").appended == 6);
  const auto desc = Drain(views.GetView("u1", "catalog", "v1", 0));
  assert((skus(desc) == std::vector<std::string>{"A4", "A1", "A6", "A2", "A3", "A5"}));
  for (std::size_t i = 1; i < desc.size(); ++i) {
    assert(desc[i].id > desc[i - 1].id);
  }

  assert(views.MaterializeView("u2", "catalog").appended == 7);
  const auto asc = Drain(views.GetView("u2", "catalog", "v1", 0));
  assert((skus(asc) == std::vector<std::string>{"A2", "A6", "A1", "A7", "A4", "A3", "A5"}));

  bool invalid = false;
  try {
    views.MaterializeView("u3", "catalog");
  } catch (const edgestore::util::InvalidArgument&) {
    invalid = true;
  }
  assert(invalid);
  assert(Drain(views.GetView("u3", "catalog", "", 0)).empty());
}

void TestCustomTransformAndPaging() {
  Harness h;
  h.config.mutable_views()->set_read_page_size(2);
  h.transforms->Register("sku_only", [](const Json& row, const Json&) -> std::optional<Json> {
    const auto& fields = row.struct_value().fields();
    auto        it     = fields.find("sku");
    if (it == fields.end()) {
      return std::nullopt;
    }
    return it->second;
  });
  h.transforms->Assign("catalog", "sku_only");

  std::vector<Json> rows;
  for (int i = 0; i < 5; ++i) {
    rows.push_back(ParseJson("{\"sku\":\"S" + std::to_string(i) + "\"}"));
  }
  rows.push_back(ParseJson(R"({"name":"no sku"})"));
  h.Mirror().PublishVersion("catalog", "v1", "c1", rows, 1000);

  auto views = h.Views();
  assert(views.MaterializeView("u1", "catalog").appended == 5);

  const auto entries = Drain(views.GetView("u1", "catalog", "v1", 0));
  assert(entries.size() == 5);
  for (int i = 0; i < 5; ++i) {
    assert(ToJson(entries[i].item) == "\"S" + std::to_string(i) + "\"");
    if (i > 0) {
      assert(entries[i].id > entries[i - 1].id);
    }
  }

  bool unknown = false;
  try {
    h.transforms->Assign("catalog", "missing");
  } catch (const edgestore::util::InvalidArgument&) {
    unknown = true;
  }
  assert(unknown);
}

void TestLatestPerKey() {
  Harness h;
  auto    mirror = h.Mirror();
  auto    views  = h.Views();

  mirror.PublishVersion("catalog", "v1", "c1", Rows({R"({"sku":"A1","price":1})", R"({"sku":"A2","price":2})"}), 1000);
  h.now = 100;
  views.MaterializeView("u1", "catalog");

  mirror.PublishVersion("catalog", "v2", "c2", Rows({R"({"sku":"A1","price":10})"}), 2000);
  h.now = 200;
  views.MaterializeView("u1", "catalog");

  const auto latest = views.LatestPerKey("u1", "catalog", "", "$.sku");
  assert(latest.size() == 2);
  assert(ToJson(latest[0].item) == R"({"price":10,"sku":"A1"})");
  assert(latest[0].version == "v2");
  assert(ToJson(latest[1].item) == R"({"price":2,"sku":"A2"})");

  // equal ts: the later append wins
  mirror.PublishVersion("catalog", "v3", "c3", Rows({R"({"sku":"A2","price":20})", R"({"sku":"A2","price":30})"}), 3000);
  h.now = 200;
  views.MaterializeView("u1", "catalog");
  const auto tied = views.LatestPerKey("u1", "catalog", "", "$.sku");
  assert(ToJson(tied[1].item) == R"({"price":30,"sku":"A2"})");

  // version filter
  const auto v1_only = views.LatestPerKey("u1", "catalog", "v1", "$.sku");
  assert(v1_only.size() == 2);
  assert(ToJson(v1_only[0].item) == R"({"price":1,"sku":"A1"})");
}

void TestViewStreamHonorsTimeout() {
  Harness h;
  h.config.mutable_views()->set_read_page_size(1);
  h.Mirror().PublishVersion("catalog", "v1", "abc123", Rows({R"({"sku":"A1"})", R"({"sku":"A2"})"}), 1000);
  auto views = h.Views();
  views.MaterializeView("u1", "catalog");

  edgestore::service::OperationOptions options;
  options.timeout = std::chrono::milliseconds(40);
  auto stream     = views.GetView("u1", "catalog", "", 0, options);
  assert(stream.Next().has_value());

  std::this_thread::sleep_for(std::chrono::milliseconds(80));
  bool aborted = false;
  try {
    stream.Next();
  } catch (const edgestore::util::TransactionAborted&) {
    aborted = true;
  }
  assert(aborted);
}

} // namespace

int main() {
  TestMaterializeMergesContext();
  TestMissingContextAndRepeatedRuns();
  TestMaterializePinsLatestVersion();
  TestNoPublishedVersion();
  TestFilterContextDropsRows();
  TestFilterContextSortsTheLog();
  TestCustomTransformAndPaging();
  TestLatestPerKey();
  TestViewStreamHonorsTimeout();

  std::cout << "edgestore_unit_view_materializer: pass\n";
  return 0;
}
