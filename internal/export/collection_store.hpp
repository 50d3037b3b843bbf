#pragma once

#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "snapshot/manager/catalog/v1/collection.pb.h"

namespace snapshot::exporting {

/*
  Destination of exported page sets.

  A staged file named <setId>.<ext> belongs to set setId; a set may
  span several files (image, PAGE XML, ...).
*/
class CollectionStore {
 public:
  using CollectionSet = snapshot::manager::catalog::v1::CollectionSet;

  virtual ~CollectionStore() = default;

  // Imports the staged files of `sets`. Returns the sets that were newly indexed.
  virtual std::vector<CollectionSet> Add(const std::string& collection_id, const std::vector<CollectionSet>& sets,
                                         const std::filesystem::path& staging_folder, bool overwrite) = 0;

  virtual std::vector<CollectionSet> ListSets(const std::string& collection_id) const = 0;
};

/*
  <collections>/<collection>/sets.json
  <collections>/<collection>/<setId>.<ext>
*/
class FolderCollectionStore final : public CollectionStore {
 public:
  explicit FolderCollectionStore(std::filesystem::path root);

  std::vector<CollectionSet> Add(const std::string& collection_id, const std::vector<CollectionSet>& sets, const std::filesystem::path& staging_folder,
                                 bool overwrite) override;

  std::vector<CollectionSet> ListSets(const std::string& collection_id) const override;

  const std::filesystem::path& Root() const { return root_; }

 private:
  std::filesystem::path IndexPath(const std::string& collection_id) const;

  std::filesystem::path root_;
  mutable std::mutex    mutex_;
};

// "0001.bin.png" -> "0001"
std::string SetIdOf(const std::string& file_name);

} // namespace snapshot::exporting
