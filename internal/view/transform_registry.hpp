#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "config/config.pb.h"
#include "internal/util/json.hpp"

namespace edgestore::view {

// Maps one dataset row to at most one view item; nullopt drops the row.
using ViewTransform = std::function<std::optional<util::Json>(const util::Json& row, const util::Json& ctx)>;

// Reorders all items derived from one pinned version before they are appended.
using ViewOrdering = std::function<void(std::vector<util::Json>& items, const util::Json& ctx)>;

struct ResolvedTransform {
  ViewTransform map;
  // empty: items are appended in row order, page by page
  ViewOrdering order;
};

inline constexpr const char* kMergeContext  = "merge_context";
inline constexpr const char* kFilterContext = "filter_context";

// Overlays the context's top-level fields onto an object row.
std::optional<util::Json> MergeContext(const util::Json& row, const util::Json& ctx);

// Keeps the row when every entry of ctx.filters matches it.
std::optional<util::Json> FilterContext(const util::Json& row, const util::Json& ctx);

// Applies ctx.sort = {"by": <top-level field>, "desc": <bool>}. Stable; items
// without the field (or with null) go last in either direction. Numbers,
// strings and booleans compare by value, mixed kinds by kind. A sort object
// without a string "by" throws InvalidArgument.
void SortByContext(std::vector<util::Json>& items, const util::Json& ctx);

/*
  Named transforms and their per-dataset assignment.

  Thread-safe. Built-ins are registered by the constructor; the default
  transform is merge_context until SetDefault changes it.
*/
class TransformRegistry {
 public:
  TransformRegistry();

  // Replaces an existing transform of the same name.
  void Register(const std::string& name, ViewTransform fn, ViewOrdering order = {});

  // Throws InvalidArgument when name is not registered.
  void Assign(const std::string& dataset_id, const std::string& name);
  void SetDefault(const std::string& name);

  // Applies views.default_transform and views.dataset_transforms.
  void Configure(const runtime::config::ViewConfig& config);

  ResolvedTransform Resolve(const std::string& dataset_id) const;

 private:
  ResolvedTransform Lookup(const std::string& name) const;

  mutable std::mutex                                 mutex_;
  std::unordered_map<std::string, ResolvedTransform> transforms_;
  std::unordered_map<std::string, std::string>       assignments_;
  std::string                                        default_name_ = kMergeContext;
};

} // namespace edgestore::view
