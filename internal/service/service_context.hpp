#pragma once

#include <memory>

#include "graphingest/config/v1/config.pb.h"

namespace graphingest::db { class Repository; }
namespace graphingest::graph { class GraphStore; }
namespace graphingest::notify { class ProgressNotifier; }

namespace graphingest::service {

/*
  Dependency container shared by all services.

  notifier may be null; progress is then only persisted and logged.
*/
struct ServiceContext {
  std::shared_ptr<graphingest::db::Repository>         repository;
  std::shared_ptr<graphingest::graph::GraphStore>      graph;
  std::shared_ptr<graphingest::notify::ProgressNotifier> notifier;
  graphingest::runtime::config::IngestConfig           ingest;
};

} // namespace graphingest::service
