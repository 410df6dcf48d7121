#pragma once

#include <memory>

#include "graphingest/config/v1/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/graph/graph_store.hpp"
#include "internal/notify/progress_hub.hpp"
#include "internal/service/ingestion_service.hpp"
#include "internal/worker/ingest_worker_pool.hpp"

namespace graphingest::factory {

/*
  Application

  Owns all long-lived components of one process. The worker pool is
  constructed but not started.
*/
struct Application {
  std::shared_ptr<db::Repository>              repository;
  std::shared_ptr<graph::GraphStore>           graph;
  std::shared_ptr<notify::ProgressHub>         hub;
  std::shared_ptr<service::IngestionService>   ingestion;
  std::shared_ptr<worker::IngestWorkerPool>    workers;
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete store types.
*/
Application Build(const graphingest::runtime::config::RuntimeConfig& config);

std::shared_ptr<db::Repository>    BuildRepository(const graphingest::runtime::config::DatabaseConfig& config);
std::shared_ptr<graph::GraphStore> BuildGraphStore(const graphingest::runtime::config::GraphConfig& config);

} // namespace graphingest::factory
