#include <cstdint>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/userdb/document_values.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "internal/util/time.hpp"

using edgestore::util::Json;

namespace {

struct UsageError : std::runtime_error {
  using std::runtime_error::runtime_error;
};

void Usage() {
  std::cerr << "Usage: edgectl --config <config.yaml> [--reader] <command> [args]\n"
            << "\n"
            << "JSON arguments are literal text, @<file>, or - for stdin.\n"
            << "\n"
            << "  publish <dataset> <version> <checksum> <ts_ms> <rows-json-array>\n"
            << "  snapshot <dataset> <rows-json-array>\n"
            << "  latest <dataset>\n"
            << "  version <dataset> <version>\n"
            << "  versions <dataset> [limit]\n"
            << "  rows <dataset> <version>\n"
            << "  set-context <user> <dataset> <ctx-json> [ts_ms]\n"
            << "  get-context <user> <dataset>\n"
            << "  materialize <user> <dataset>\n"
            << "  view <user> <dataset> [version|*] [since_ts_ms]\n"
            << "  latest-per-key <user> <dataset> <version|*> <key_path>\n"
            << "  create-table <user> <table> <pk_path> [ts_path] [phy_table]\n"
            << "  describe-table <user> <table>\n"
            << "  list-tables <user>\n"
            << "  drop-table <user> <table>\n"
            << "  create-index <user> <table> <col> <json_path> <string|number|integer|datetime|boolean>\n"
            << "  drop-index <user> <table> <col>\n"
            << "  upsert <user> <table> <doc-json> [--force] [--ts <ms>]\n"
            << "  upsert-batch <user> <table> <docs-json-array> [--force]\n"
            << "  get <user> <table> <pk>\n"
            << "  delete <user> <table> <pk>...\n"
            << "  query <user> <table> <col> <eq|lt|lte|gt|gte|in> <operand-json>\n"
            << "  list <user> <table> [--since <ms>] [--limit <n>] [--order pk|updated_asc|updated_desc] [--after <pk>]\n";
}

std::int64_t ParseInt(const std::string& text, const char* what) {
  std::size_t  used  = 0;
  std::int64_t value = 0;
  try {
    value = std::stoll(text, &used);
  } catch (const std::logic_error&) {
    throw UsageError(std::string(what) + " must be an integer: " + text);
  }
  if (used != text.size()) {
    throw UsageError(std::string(what) + " must be an integer: " + text);
  }
  return value;
}

Json ReadJsonArg(const std::string& arg) {
  std::string text;
  if (arg == "-") {
    text.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  } else if (!arg.empty() && arg[0] == '@') {
    std::ifstream in(arg.substr(1));
    if (!in) {
      throw UsageError("cannot open " + arg.substr(1));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    text = buffer.str();
  } else {
    text = arg;
  }
  return edgestore::util::ParseJson(text);
}

std::vector<Json> ReadJsonArray(const std::string& arg) {
  const auto value = ReadJsonArg(arg);
  if (value.kind_case() != Json::kListValue) {
    throw UsageError("expected a JSON array");
  }
  return std::vector<Json>(value.list_value().values().begin(), value.list_value().values().end());
}

// ------------------------------------------------------------
// Output helpers
// ------------------------------------------------------------

class Out {
 public:
  Out& Str(const std::string& key, const std::string& value) {
    Set(key, edgestore::util::JsonString(value));
    return *this;
  }
  Out& Num(const std::string& key, double value) {
    Set(key, edgestore::util::JsonNumber(value));
    return *this;
  }
  Out& Bool(const std::string& key, bool value) {
    Set(key, edgestore::util::JsonBool(value));
    return *this;
  }
  Out& Set(const std::string& key, const Json& value) {
    (*json_.mutable_struct_value()->mutable_fields())[key] = value;
    return *this;
  }
  const Json& Value() const {
    return json_;
  }

 private:
  Json json_ = edgestore::util::JsonObject();
};

Json List(const std::vector<Json>& values) {
  Json list;
  auto* items = list.mutable_list_value();
  for (const auto& value : values) {
    *items->add_values() = value;
  }
  return list;
}

void Print(const Json& value) {
  std::cout << edgestore::util::ToJson(value) << "\n";
}

Json VersionJson(const edgestore::mirror::VersionInfo& info) {
  return Out()
      .Str("dataset_id", info.dataset_id)
      .Str("version", info.version)
      .Str("checksum", info.checksum)
      .Num("ts", static_cast<double>(info.ts))
      .Num("row_count", static_cast<double>(info.row_count))
      .Value();
}

Json TableJson(const edgestore::db::model::UserTableRecord& table) {
  return Out()
      .Str("user_id", table.user_id)
      .Str("table_name", table.table_name)
      .Str("phy_table", table.phy_table)
      .Str("pk_path", table.pk_path)
      .Str("ts_path", table.ts_path)
      .Num("created_at", static_cast<double>(table.created_at))
      .Value();
}

Json DocumentJson(const edgestore::userdb::StoredDocument& doc) {
  return Out().Str("pk", doc.pk).Num("updated_at", static_cast<double>(doc.updated_at)).Set("doc", doc.doc).Value();
}

Json ViewJson(const edgestore::view::ViewEntry& entry) {
  return Out().Num("id", static_cast<double>(entry.id)).Str("version", entry.version).Num("ts", static_cast<double>(entry.ts)).Set("item", entry.item).Value();
}

// ------------------------------------------------------------
// Commands
// ------------------------------------------------------------

int Run(edgestore::factory::ServiceSet& services, const std::vector<std::string>& args) {
  const auto& cmd  = args.at(0);
  auto        need = [&](std::size_t count) {
    if (args.size() < count + 1) {
      throw UsageError(cmd + " expects at least " + std::to_string(count) + " arguments");
    }
  };

  if (cmd == "publish") {
    need(5);
    const auto result = services.mirror->PublishVersion(args[1], args[2], args[3], ReadJsonArray(args[5]), ParseInt(args[4], "ts_ms"));
    Print(Out().Bool("created", result.created).Num("row_count", static_cast<double>(result.row_count)).Value());
    return 0;
  }

  if (cmd == "snapshot") {
    need(2);
    Print(VersionJson(services.mirror->PublishSnapshot(args[1], ReadJsonArray(args[2]))));
    return 0;
  }

  if (cmd == "latest") {
    need(1);
    Print(VersionJson(services.mirror->GetLatestVersion(args[1])));
    return 0;
  }

  if (cmd == "version") {
    need(2);
    Print(VersionJson(services.mirror->GetVersion(args[1], args[2])));
    return 0;
  }

  if (cmd == "versions") {
    need(1);
    const std::size_t limit = args.size() > 2 ? static_cast<std::size_t>(ParseInt(args[2], "limit")) : 0;
    std::vector<Json> out;
    for (const auto& info : services.mirror->ListVersions(args[1], limit)) {
      out.push_back(VersionJson(info));
    }
    Print(List(out));
    return 0;
  }

  if (cmd == "rows") {
    need(2);
    auto stream = services.mirror->GetRows(args[1], args[2]);
    while (auto row = stream.Next()) {
      Print(*row);
    }
    return 0;
  }

  if (cmd == "set-context") {
    need(3);
    const auto ts = args.size() > 4 ? ParseInt(args[4], "ts_ms") : edgestore::util::NowMillis();
    services.contexts->SetContext(args[1], args[2], ReadJsonArg(args[3]), ts);
    Print(Out().Bool("ok", true).Value());
    return 0;
  }

  if (cmd == "get-context") {
    need(2);
    const auto stored = services.contexts->GetContext(args[1], args[2]);
    Print(Out().Set("ctx", stored.ctx).Num("ts", static_cast<double>(stored.ts)).Value());
    return 0;
  }

  if (cmd == "materialize") {
    need(2);
    const auto result = services.views->MaterializeView(args[1], args[2]);
    Print(Out().Str("version", result.version).Str("checksum", result.checksum).Num("appended", static_cast<double>(result.appended)).Value());
    return 0;
  }

  if (cmd == "view") {
    need(2);
    const std::string  version = args.size() > 3 && args[3] != "*" ? args[3] : "";
    const std::int64_t since   = args.size() > 4 ? ParseInt(args[4], "since_ts_ms") : 0;
    auto               stream  = services.views->GetView(args[1], args[2], version, since);
    while (auto entry = stream.Next()) {
      Print(ViewJson(*entry));
    }
    return 0;
  }

  if (cmd == "latest-per-key") {
    need(4);
    std::vector<Json> out;
    for (const auto& entry : services.views->LatestPerKey(args[1], args[2], args[3] == "*" ? "" : args[3], args[4])) {
      out.push_back(ViewJson(entry));
    }
    Print(List(out));
    return 0;
  }

  if (cmd == "create-table") {
    need(3);
    edgestore::userdb::TableSpec spec;
    spec.user_id    = args[1];
    spec.table_name = args[2];
    spec.pk_path    = args[3];
    spec.ts_path    = args.size() > 4 ? args[4] : "";
    spec.phy_table  = args.size() > 5 ? args[5] : "";
    Print(TableJson(services.tables->CreateTable(spec)));
    return 0;
  }

  if (cmd == "describe-table") {
    need(2);
    const auto        description = services.tables->DescribeTable(args[1], args[2]);
    std::vector<Json> indexes;
    for (const auto& index : description.indexes) {
      indexes.push_back(Out()
                            .Str("col_name", index.index.col_name)
                            .Str("json_path", index.index.json_path)
                            .Str("col_type", std::string(edgestore::db::model::ColumnTypeName(index.index.col_type)))
                            .Str("state", std::string(edgestore::db::model::IndexStateName(index.index.state)))
                            .Num("entries", static_cast<double>(index.entries))
                            .Value());
    }
    Print(Out().Set("table", TableJson(description.table)).Set("indexes", List(indexes)).Value());
    return 0;
  }

  if (cmd == "list-tables") {
    need(1);
    std::vector<Json> out;
    for (const auto& table : services.tables->ListTables(args[1])) {
      out.push_back(TableJson(table));
    }
    Print(List(out));
    return 0;
  }

  if (cmd == "drop-table") {
    need(2);
    services.tables->DropTable(args[1], args[2]);
    Print(Out().Bool("ok", true).Value());
    return 0;
  }

  if (cmd == "create-index") {
    need(5);
    const auto type = edgestore::db::model::ParseColumnType(args[5]);
    if (!type) {
      throw UsageError("unknown column type: " + args[5]);
    }
    const auto result = services.tables->CreateIndex(args[1], args[2], {args[3], args[4], *type});
    Print(Out().Num("indexed", static_cast<double>(result.indexed)).Bool("resumed", result.resumed).Value());
    return 0;
  }

  if (cmd == "drop-index") {
    need(3);
    services.tables->DropIndex(args[1], args[2], args[3]);
    Print(Out().Bool("ok", true).Value());
    return 0;
  }

  if (cmd == "upsert" || cmd == "upsert-batch") {
    need(3);
    edgestore::userdb::UpsertOptions upsert;
    for (std::size_t i = 4; i < args.size(); ++i) {
      if (args[i] == "--force") {
        upsert.mode = edgestore::userdb::WriteMode::kForce;
      } else if (args[i] == "--ts" && i + 1 < args.size()) {
        upsert.client_ts = ParseInt(args[++i], "--ts");
      } else {
        throw UsageError("unknown option: " + args[i]);
      }
    }

    if (cmd == "upsert") {
      const auto result = services.tables->Upsert(args[1], args[2], ReadJsonArg(args[3]), upsert);
      Print(Out().Str("pk", result.pk).Num("ts", static_cast<double>(result.ts)).Value());
      return 0;
    }

    std::vector<Json> out;
    for (const auto& row : services.tables->UpsertBatch(args[1], args[2], ReadJsonArray(args[3]), upsert)) {
      out.push_back(Out().Str("pk", row.pk).Num("ts", static_cast<double>(row.ts)).Bool("stale", row.stale).Value());
    }
    Print(List(out));
    return 0;
  }

  if (cmd == "get") {
    need(3);
    Print(DocumentJson(services.tables->Get(args[1], args[2], args[3])));
    return 0;
  }

  if (cmd == "delete") {
    need(3);
    const std::vector<std::string> pks(args.begin() + 3, args.end());
    Print(Out().Num("deleted", static_cast<double>(services.tables->Delete(args[1], args[2], pks))).Value());
    return 0;
  }

  if (cmd == "query") {
    need(5);
    const auto op = edgestore::userdb::ParseCompareOp(args[4]);
    if (!op) {
      throw UsageError("unknown operator: " + args[4]);
    }
    edgestore::userdb::Predicate predicate;
    predicate.op       = *op;
    const auto operand = ReadJsonArg(args[5]);
    if (*op == edgestore::db::model::CompareOp::kIn && operand.kind_case() == Json::kListValue) {
      predicate.operands.assign(operand.list_value().values().begin(), operand.list_value().values().end());
    } else {
      predicate.operands.push_back(operand);
    }

    const auto        result = services.tables->Query(args[1], args[2], args[3], predicate);
    std::vector<Json> docs;
    for (const auto& doc : result.documents) {
      docs.push_back(DocumentJson(doc));
    }
    Print(Out()
              .Set("documents", List(docs))
              .Set("plan", Out()
                               .Bool("indexed", result.plan.indexed)
                               .Str("index_column", result.plan.index_column)
                               .Num("scanned_documents", static_cast<double>(result.plan.scanned_documents))
                               .Value())
              .Value());
    return 0;
  }

  if (cmd == "list") {
    need(2);
    if ((args.size() - 3) % 2 != 0) {
      throw UsageError("options take one value each");
    }
    edgestore::userdb::ListOptions list;
    for (std::size_t i = 3; i + 1 < args.size(); i += 2) {
      const auto& flag  = args[i];
      const auto& value = args[i + 1];
      if (flag == "--since") {
        list.since = ParseInt(value, "--since");
      } else if (flag == "--limit") {
        list.limit = static_cast<std::size_t>(ParseInt(value, "--limit"));
      } else if (flag == "--after") {
        list.after_pk = value;
      } else if (flag == "--order" && value == "pk") {
        list.order = edgestore::db::model::DocumentOrder::kByPk;
      } else if (flag == "--order" && value == "updated_asc") {
        list.order = edgestore::db::model::DocumentOrder::kUpdatedAsc;
      } else if (flag == "--order" && value == "updated_desc") {
        list.order = edgestore::db::model::DocumentOrder::kUpdatedDesc;
      } else {
        throw UsageError("unknown option: " + flag + " " + value);
      }
    }
    std::vector<Json> out;
    for (const auto& doc : services.tables->List(args[1], args[2], list)) {
      out.push_back(DocumentJson(doc));
    }
    Print(List(out));
    return 0;
  }

  throw UsageError("unknown command: " + cmd);
}

} // namespace

int main(int argc, char** argv) {
  std::string              config_path;
  bool                     reader = false;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (args.empty() && arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (args.empty() && arg == "--reader") {
      reader = true;
    } else {
      args.push_back(arg);
    }
  }
  if (config_path.empty() || args.empty()) {
    Usage();
    return 1;
  }

  try {
    auto config = edgestore::config::ConfigLoader::LoadFromYaml(config_path);

    edgestore::observability::InitializeTracing(config);
    edgestore::observability::InitializeMetrics(config);
    edgestore::observability::InitializeLogging(config);

    auto app  = edgestore::factory::Build(config);
    int  code = Run(reader ? app.reader : app.writer, args);

    edgestore::observability::ShutdownLogging();
    edgestore::observability::ShutdownMetrics();
    edgestore::observability::ShutdownTracing();
    return code;
  } catch (const UsageError& e) {
    std::cerr << "usage error: " << e.what() << "\n";
    Usage();
    return 1;
  } catch (const edgestore::util::Error& e) {
    std::cerr << edgestore::util::ErrorKindName(e.Kind()) << ": " << e.what() << "\n";
    edgestore::observability::ShutdownLogging();
    return 2;
  } catch (const std::exception& e) {
    EDGESTORE_LOG_ERROR("Fatal error", {edgestore::observability::StringField("error", e.what())});
    std::cerr << "error: " << e.what() << "\n";
    edgestore::observability::ShutdownLogging();
    return 2;
  }
}
