#pragma once

#include <memory>

namespace snapshot::core { class SnapshotManager; }
namespace snapshot::job { class JobManager; class ProviderRegistry; }
namespace snapshot::exporting { class CollectionBridge; class CollectionStore; class SnapshotArchiver; }

namespace snapshot::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<snapshot::core::SnapshotManager> snapshots;
  std::shared_ptr<snapshot::job::JobManager> jobs;
  std::shared_ptr<snapshot::job::ProviderRegistry> providers;
  std::shared_ptr<snapshot::exporting::CollectionStore> collections;
  std::shared_ptr<snapshot::exporting::CollectionBridge> collection_bridge;
  std::shared_ptr<snapshot::exporting::SnapshotArchiver> archiver;
};

}
