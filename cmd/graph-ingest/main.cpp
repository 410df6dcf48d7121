#include <chrono>
#include <csignal>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/notify/log_subscriber.hpp"
#include "internal/observability/logging.hpp"

using graphingest::observability::IntField;
using graphingest::observability::StringField;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

namespace {

struct FileArg {
  std::optional<std::string> label;
  std::string                path;
};

struct Options {
  std::string          config_path;
  std::string          dataset;
  std::string          description;
  bool                 cascade = false;
  std::vector<FileArg> nodes;
  std::vector<FileArg> relationships;
};

void Usage() {
  std::cerr << "Usage:\n"
            << "  graph-ingest [--config <config.yaml>] --dataset <name> [--description <text>] [--cascade]\n"
            << "               [--nodes [Label=]file.csv]... [--relationships [TYPE=]file.csv]...\n";
}

// "Label=path" or "path".
FileArg ParseFileArg(const std::string& value) {
  const auto eq = value.find('=');
  if (eq == std::string::npos || eq == 0) {
    return {std::nullopt, value};
  }
  return {value.substr(0, eq), value.substr(eq + 1)};
}

std::optional<Options> ParseArgs(int argc, char** argv) {
  Options options;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const auto        next = [&]() -> std::optional<std::string> {
      if (i + 1 >= argc) {
        std::cerr << "missing value for " << arg << "\n";
        return std::nullopt;
      }
      return std::string(argv[++i]);
    };

    if (arg == "--cascade") {
      options.cascade = true;
      continue;
    }
    if (arg == "--help" || arg == "-h") {
      return std::nullopt;
    }

    auto value = next();
    if (!value) return std::nullopt;

    if (arg == "--config") {
      options.config_path = *value;
    } else if (arg == "--dataset") {
      options.dataset = *value;
    } else if (arg == "--description") {
      options.description = *value;
    } else if (arg == "--nodes") {
      options.nodes.push_back(ParseFileArg(*value));
    } else if (arg == "--relationships") {
      options.relationships.push_back(ParseFileArg(*value));
    } else {
      std::cerr << "unknown argument: " << arg << "\n";
      return std::nullopt;
    }
  }

  if (options.dataset.empty() || (options.nodes.empty() && options.relationships.empty())) {
    return std::nullopt;
  }
  return options;
}

// Blocks until the pool drains; a signal cancels running tasks instead.
void WaitForWorkers(graphingest::worker::IngestWorkerPool& workers) {
  while (workers.Outstanding() > 0) {
    if (!g_running) {
      GRAPHINGEST_LOG_WARN("interrupted, cancelling running tasks");
      workers.Stop();
      return;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
}

std::vector<std::int64_t> SubmitAll(graphingest::service::IngestionService& ingestion, graphingest::worker::IngestWorkerPool& workers,
                                    std::int64_t dataset_id, const std::vector<FileArg>& files, graphingest::v1::FileKind kind) {
  std::vector<std::int64_t> ids;
  for (const auto& file : files) {
    graphingest::service::FileSubmission submission;
    submission.dataset_id = dataset_id;
    submission.path       = file.path;
    submission.kind       = kind;
    submission.label      = file.label;

    const auto task = ingestion.SubmitFile(submission);
    workers.Enqueue(task.id);
    ids.push_back(task.id);
  }
  return ids;
}

} // namespace

int main(int argc, char** argv) {
  const auto options = ParseArgs(argc, argv);
  if (!options) {
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    graphingest::runtime::config::RuntimeConfig config;
    if (!options->config_path.empty()) {
      config = graphingest::config::ConfigLoader::LoadFromYaml(options->config_path);
    } else {
      graphingest::config::ConfigLoader::ApplyDefaults(config);
    }

    graphingest::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = graphingest::factory::Build(config);

    graphingest::notify::LogSubscriber progress_log(*app.hub);

    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    app.workers->Start();

    const auto dataset = app.ingestion->CreateDataset(options->dataset, options->description, options->cascade);

    // Relationship files resolve against entity labels, so entity files go first.
    auto task_ids = SubmitAll(*app.ingestion, *app.workers, dataset.id, options->nodes, graphingest::v1::FILE_KIND_ENTITY);
    WaitForWorkers(*app.workers);

    if (g_running) {
      const auto relationship_ids = SubmitAll(*app.ingestion, *app.workers, dataset.id, options->relationships, graphingest::v1::FILE_KIND_RELATIONSHIP);
      task_ids.insert(task_ids.end(), relationship_ids.begin(), relationship_ids.end());
      WaitForWorkers(*app.workers);
    }
    app.workers->Stop();

    // ------------------------------------------------------------
    // Summary
    // ------------------------------------------------------------
    int failed = 0;
    for (const auto task_id : task_ids) {
      const auto task = app.ingestion->GetTask(task_id);
      if (!task) continue;
      const bool ok = task->status == graphingest::v1::TASK_STATUS_COMPLETED;
      if (!ok) ++failed;
      std::cout << (ok ? "[ok]     " : "[failed] ") << task->file_name << " (" << task->label << "): "
                << (ok ? std::to_string(task->processed_rows) + "/" + std::to_string(task->total_rows) + " rows" : task->error_message) << "\n";
      for (const auto& warning : task->warnings) {
        std::cout << "         warning: " << warning << "\n";
      }
    }

    if (const auto summary = app.ingestion->GetDataset(dataset.id)) {
      std::cout << "dataset " << summary->name << " (" << summary->id << "): " << graphingest::v1::DatasetStatus_Name(summary->status) << ", "
                << summary->total_nodes << " nodes, " << summary->total_relationships << " relationships, " << summary->processed_files << "/"
                << summary->total_files << " files\n";
    }

    const auto metadata = app.ingestion->DatasetMetadata(dataset.id);
    for (const auto& label : metadata.labels) {
      std::cout << "  :" << label.label << " " << label.nodes << " nodes";
      if (!label.property_keys.empty()) {
        std::cout << " [";
        for (std::size_t i = 0; i < label.property_keys.size(); ++i) {
          std::cout << (i == 0 ? "" : ", ") << label.property_keys[i];
        }
        std::cout << "]";
      }
      std::cout << "\n";
    }
    for (const auto& type : metadata.relationship_types) {
      std::cout << "  [:" << type.type << "] " << type.relationships << " relationships\n";
    }

    GRAPHINGEST_LOG_INFO("ingestion finished", {IntField("tasks", static_cast<std::int64_t>(task_ids.size())), IntField("failed", failed)});
    graphingest::observability::ShutdownLogging();
    return failed == 0 && g_running ? 0 : 3;
  } catch (const std::exception& e) {
    GRAPHINGEST_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    graphingest::observability::ShutdownLogging();
    return 2;
  }
}
