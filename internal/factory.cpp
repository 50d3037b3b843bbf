#include "factory.hpp"

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/core/snapshot_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/export/collection_bridge.hpp"
#include "internal/export/collection_store.hpp"
#include "internal/export/snapshot_archiver.hpp"
#include "internal/grpc/export_server.hpp"
#include "internal/grpc/job_server.hpp"
#include "internal/grpc/snapshot_server.hpp"
#include "internal/job/provider_registry.hpp"
#include "internal/observability/logging.hpp"
#include "internal/project/project_registry.hpp"
#include "internal/sandbox/sandbox_registry.hpp"
#include "internal/service/export_service.hpp"
#include "internal/service/job_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/snapshot_service.hpp"
#if SNAPSHOT_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

namespace snapshot::factory {

using namespace snapshot;

namespace {

// Staged collection files live next to the collections, under a name no
// collection id can take.
constexpr const char* kCollectionStagingFolder = ".staging";

std::shared_ptr<db::Repository> BuildRepository(const snapshot::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if SNAPSHOT_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    db::sqlite::SqliteRepository::BootstrapSchema(*sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

/*
    Build full application dependency graph
*/
Application Build(const snapshot::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Workspace
  // ------------------------------------------------------------------
  const std::filesystem::path workspace   = config.workspace().root();
  const auto                  projects    = workspace / config.workspace().projects_folder();
  const auto                  collections = workspace / config.workspace().collections_folder();
  std::filesystem::create_directories(projects);
  std::filesystem::create_directories(collections);

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto project_registry = std::make_shared<project::ProjectRegistry>(projects);
  auto sandbox_registry = std::make_shared<sandbox::SandboxRegistry>(project_registry);
  auto repository       = BuildRepository(config);

  auto snapshot_manager = std::make_shared<core::SnapshotManager>(project_registry, sandbox_registry, config.sandbox_defaults());
  auto providers        = job::ProviderRegistry::Build(config.providers(), project_registry);

  // ------------------------------------------------------------------
  // Job system
  // ------------------------------------------------------------------
  app.jobs = std::make_shared<job::JobManager>(snapshot_manager, providers, repository, config.scheduler());

  for (uint32_t i = 0; i < config.scheduler().worker_threads(); ++i) {
    auto worker = std::make_shared<job::JobWorker>(app.jobs->Queue(), app.jobs);
    worker->Start();
    // Keep ownership of workers so they live for process lifetime
    app.background_workers.push_back(std::move(worker));
  }

  // ------------------------------------------------------------------
  // Export
  // ------------------------------------------------------------------
  auto collection_store  = std::make_shared<exporting::FolderCollectionStore>(collections);
  auto collection_bridge = std::make_shared<exporting::CollectionBridge>(snapshot_manager, collection_store, collections / kCollectionStagingFolder);
  auto archiver          = std::make_shared<exporting::SnapshotArchiver>(snapshot_manager, project_registry);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.snapshots         = snapshot_manager;
  ctx.jobs              = app.jobs;
  ctx.providers         = providers;
  ctx.collections       = collection_store;
  ctx.collection_bridge = collection_bridge;
  ctx.archiver          = archiver;

  auto snapshot_service = std::make_shared<service::SnapshotService>(ctx);
  auto job_service      = std::make_shared<service::JobService>(ctx);
  auto export_service   = std::make_shared<service::ExportService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::SnapshotServer>(snapshot_service));
  app.grpc_services.push_back(std::make_unique<grpc::JobServer>(job_service));
  app.grpc_services.push_back(std::make_unique<grpc::ExportServer>(export_service));

  SNAPSHOT_LOG_INFO("application built", {observability::StringField("workspace", workspace.string()),
                                          observability::UIntField("providers", providers->List().size()),
                                          observability::UIntField("workers", app.background_workers.size())});
  return app;
}

} // namespace snapshot::factory
