#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/auth/capability.hpp"
#include "internal/context/user_context_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/mirror/dataset_mirror.hpp"
#include "internal/service/change_feed.hpp"
#include "internal/userdb/table_lock_registry.hpp"
#include "internal/userdb/user_table_engine.hpp"
#include "internal/view/transform_registry.hpp"
#include "internal/view/view_materializer.hpp"

namespace edgestore::factory {

/*
  The four engines bound to one repository and one capability.
*/
struct ServiceSet {
  std::shared_ptr<mirror::DatasetMirror>     mirror;
  std::shared_ptr<context::UserContextStore> contexts;
  std::shared_ptr<view::ViewMaterializer>    views;
  std::shared_ptr<userdb::UserTableEngine>   tables;
};

/*
  Application

  Owns all long-lived objects of the process. The reader set runs over a
  read-only repository guard, so its mutations fail at both layers.
*/
struct Application {
  std::shared_ptr<db::Repository>            repository;
  std::shared_ptr<view::TransformRegistry>   transforms;
  std::shared_ptr<userdb::TableLockRegistry> locks;
  // fed by the writer set after each commit
  std::shared_ptr<service::ChangeFeed> changes;

  ServiceSet writer;
  ServiceSet reader;
};

/*
  BuildRepository

  Opens the configured backend, provisions its schema and writes the
  readiness marker. This is the ONLY place that knows concrete DB types.
*/
std::shared_ptr<db::Repository> BuildRepository(const runtime::config::RuntimeConfig& config);

ServiceSet BuildServices(std::shared_ptr<db::Repository> repository, const runtime::config::RuntimeConfig& config, auth::Capability capability,
                         std::shared_ptr<view::TransformRegistry> transforms, std::shared_ptr<userdb::TableLockRegistry> locks,
                         std::shared_ptr<service::ChangeFeed> changes = nullptr);

Application Build(const runtime::config::RuntimeConfig& config);

} // namespace edgestore::factory
