#include "transform_registry.hpp"

#include <algorithm>
#include <utility>

#include "internal/util/errors.hpp"

namespace edgestore::view {

namespace {

bool FilterMatches(const util::Json* field, const util::Json& expected) {
  if (expected.kind_case() == util::Json::kListValue) {
    if (!field) {
      return false;
    }
    for (const auto& candidate : expected.list_value().values()) {
      if (util::JsonEquals(*field, candidate)) {
        return true;
      }
    }
    return false;
  }
  return field && util::JsonEquals(*field, expected);
}

const util::Json* SortKey(const util::Json& item, const std::string& by) {
  if (!util::IsObject(item)) {
    return nullptr;
  }
  const auto& fields = item.struct_value().fields();
  const auto  it     = fields.find(by);
  if (it == fields.end() || it->second.kind_case() == util::Json::kNullValue) {
    return nullptr;
  }
  return &it->second;
}

int KindRank(const util::Json& value) {
  switch (value.kind_case()) {
    case util::Json::kBoolValue:
      return 0;
    case util::Json::kNumberValue:
      return 1;
    case util::Json::kStringValue:
      return 2;
    default:
      return 3;
  }
}

// <0, 0, >0 like strcmp; both values present
int CompareSortValues(const util::Json& a, const util::Json& b) {
  const int ra = KindRank(a);
  const int rb = KindRank(b);
  if (ra != rb) {
    return ra < rb ? -1 : 1;
  }
  switch (a.kind_case()) {
    case util::Json::kBoolValue:
      return static_cast<int>(a.bool_value()) - static_cast<int>(b.bool_value());
    case util::Json::kNumberValue:
      return a.number_value() < b.number_value() ? -1 : (b.number_value() < a.number_value() ? 1 : 0);
    case util::Json::kStringValue:
      return a.string_value().compare(b.string_value());
    default:
      return util::ToJson(a).compare(util::ToJson(b));
  }
}

} // namespace

std::optional<util::Json> MergeContext(const util::Json& row, const util::Json& ctx) {
  if (!util::IsObject(row) || !util::IsObject(ctx)) {
    return row;
  }
  util::Json merged = row;
  auto*      fields = merged.mutable_struct_value()->mutable_fields();
  for (const auto& [key, value] : ctx.struct_value().fields()) {
    (*fields)[key] = value;
  }
  return merged;
}

std::optional<util::Json> FilterContext(const util::Json& row, const util::Json& ctx) {
  if (!util::IsObject(ctx)) {
    return row;
  }
  const auto& ctx_fields = ctx.struct_value().fields();
  const auto  filters    = ctx_fields.find("filters");
  if (filters == ctx_fields.end() || !util::IsObject(filters->second)) {
    return row;
  }
  if (!util::IsObject(row)) {
    return std::nullopt;
  }

  const auto& row_fields = row.struct_value().fields();
  for (const auto& [key, expected] : filters->second.struct_value().fields()) {
    const auto        it    = row_fields.find(key);
    const util::Json* field = it == row_fields.end() ? nullptr : &it->second;
    if (!FilterMatches(field, expected)) {
      return std::nullopt;
    }
  }
  return row;
}

void SortByContext(std::vector<util::Json>& items, const util::Json& ctx) {
  if (!util::IsObject(ctx)) {
    return;
  }
  const auto& ctx_fields = ctx.struct_value().fields();
  const auto  sort       = ctx_fields.find("sort");
  if (sort == ctx_fields.end() || sort->second.kind_case() == util::Json::kNullValue) {
    return;
  }
  if (!util::IsObject(sort->second)) {
    throw util::InvalidArgument("ctx.sort must be an object");
  }

  const auto& spec = sort->second.struct_value().fields();
  const auto  by   = spec.find("by");
  if (by == spec.end() || by->second.kind_case() != util::Json::kStringValue) {
    throw util::InvalidArgument("ctx.sort.by must be a field name");
  }
  const auto desc_it = spec.find("desc");
  const bool desc    = desc_it != spec.end() && desc_it->second.kind_case() == util::Json::kBoolValue && desc_it->second.bool_value();
  const auto field   = by->second.string_value();

  std::stable_sort(items.begin(), items.end(), [&](const util::Json& a, const util::Json& b) {
    const auto* ka = SortKey(a, field);
    const auto* kb = SortKey(b, field);
    if (!ka || !kb) {
      return ka != nullptr && kb == nullptr;
    }
    const int cmp = CompareSortValues(*ka, *kb);
    return desc ? cmp > 0 : cmp < 0;
  });
}

TransformRegistry::TransformRegistry() {
  transforms_.emplace(kMergeContext, ResolvedTransform{MergeContext, {}});
  transforms_.emplace(kFilterContext, ResolvedTransform{FilterContext, SortByContext});
}

void TransformRegistry::Register(const std::string& name, ViewTransform fn, ViewOrdering order) {
  if (name.empty() || !fn) {
    throw util::InvalidArgument("register transform: name and function are required");
  }
  std::lock_guard lock(mutex_);
  transforms_[name] = ResolvedTransform{std::move(fn), std::move(order)};
}

void TransformRegistry::Assign(const std::string& dataset_id, const std::string& name) {
  std::lock_guard lock(mutex_);
  if (!transforms_.count(name)) {
    throw util::InvalidArgument("assign transform: unknown transform '" + name + "'");
  }
  assignments_[dataset_id] = name;
}

void TransformRegistry::SetDefault(const std::string& name) {
  std::lock_guard lock(mutex_);
  if (!transforms_.count(name)) {
    throw util::InvalidArgument("default transform: unknown transform '" + name + "'");
  }
  default_name_ = name;
}

void TransformRegistry::Configure(const runtime::config::ViewConfig& config) {
  if (!config.default_transform().empty()) {
    SetDefault(config.default_transform());
  }
  for (const auto& [dataset_id, name] : config.dataset_transforms()) {
    Assign(dataset_id, name);
  }
}

ResolvedTransform TransformRegistry::Resolve(const std::string& dataset_id) const {
  std::lock_guard lock(mutex_);
  const auto      assigned = assignments_.find(dataset_id);
  return Lookup(assigned == assignments_.end() ? default_name_ : assigned->second);
}

ResolvedTransform TransformRegistry::Lookup(const std::string& name) const {
  const auto it = transforms_.find(name);
  if (it == transforms_.end()) {
    throw util::InvalidArgument("resolve transform: unknown transform '" + name + "'");
  }
  return it->second;
}

} // namespace edgestore::view
