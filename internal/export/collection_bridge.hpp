#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "collection_store.hpp"
#include "internal/core/snapshot_manager.hpp"

namespace snapshot::exporting {

struct AddToCollectionRequest {
  std::string  project_id;
  std::string  sandbox_id;
  model::Track track;
  std::string  collection_id;
  // Empty selects every folio of the project.
  std::vector<std::string> folio_ids;
  bool                     include_keywords = false;
  std::string              user;
};

/*
  CollectionBridge

  Turns the page output of an import-capable snapshot into collection
  sets, one per folio. Files are staged under a private folder that is
  removed afterwards whatever the outcome; files that are unmapped or
  missing on disk are left out.
*/
class CollectionBridge {
 public:
  CollectionBridge(std::shared_ptr<core::SnapshotManager> snapshots, std::shared_ptr<CollectionStore> store, std::filesystem::path staging_root);

  // Throws util::BadRequest unless the snapshot's step kind is import-capable,
  // util::PreconditionFailed when its file group is absent.
  std::vector<CollectionStore::CollectionSet> AddSnapshot(const AddToCollectionRequest& request);

  // Staged file name: "<folio>" followed by whatever follows the folio id in
  // the source name, or "<folio>.<source name>" when it does not contain it.
  static std::string StagedName(const std::string& folio_id, const std::string& source_name);

 private:
  std::shared_ptr<core::SnapshotManager> snapshots_;
  std::shared_ptr<CollectionStore>       store_;
  std::filesystem::path                  staging_root_;
};

} // namespace snapshot::exporting
