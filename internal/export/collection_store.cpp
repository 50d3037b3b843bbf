#include "collection_store.hpp"

#include <set>
#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/common/proto_json.hpp"

namespace snapshot::exporting {

using snapshot::manager::catalog::v1::CollectionSetIndex;
using observability::StringField;
using observability::UIntField;

namespace {

constexpr const char* kIndexFileName = "sets.json";

CollectionSetIndex LoadIndex(const std::filesystem::path& path) {
  CollectionSetIndex index;
  if (std::filesystem::exists(path)) {
    storage::common::LoadProtoJson(path, &index);
  }
  return index;
}

} // namespace

std::string SetIdOf(const std::string& file_name) {
  const auto dot = file_name.find('.');
  return dot == std::string::npos ? std::string{} : file_name.substr(0, dot);
}

FolderCollectionStore::FolderCollectionStore(std::filesystem::path root) : root_(std::move(root)) {
}

std::filesystem::path FolderCollectionStore::IndexPath(const std::string& collection_id) const {
  return storage::common::ChildFolder(root_, "collection", collection_id) / kIndexFileName;
}

std::vector<CollectionStore::CollectionSet> FolderCollectionStore::Add(const std::string& collection_id, const std::vector<CollectionSet>& sets,
                                                                       const std::filesystem::path& staging_folder, bool overwrite) {
  const auto folder = storage::common::ChildFolder(root_, "collection", collection_id);

  std::unordered_set<std::string> requested;
  for (const auto& set : sets) {
    requested.insert(set.id());
  }

  std::lock_guard lock(mutex_);
  std::filesystem::create_directories(folder);

  std::set<std::string> imported;
  for (const auto& entry : std::filesystem::directory_iterator(staging_folder)) {
    if (!entry.is_regular_file()) continue;

    const auto name   = entry.path().filename().string();
    const auto set_id = SetIdOf(name);
    if (set_id.empty() || !requested.count(set_id)) continue;

    const auto target = folder / name;
    if (std::filesystem::exists(target)) {
      if (!overwrite) continue;
      std::filesystem::remove(target);
    }
    std::filesystem::rename(entry.path(), target);
    imported.insert(set_id);
  }

  auto index = LoadIndex(folder / kIndexFileName);

  std::unordered_set<std::string> indexed;
  for (const auto& set : index.sets()) {
    indexed.insert(set.id());
  }

  std::vector<CollectionSet> added;
  for (const auto& set : sets) {
    if (!imported.count(set.id()) || indexed.count(set.id())) continue;
    *index.add_sets() = set;
    indexed.insert(set.id());
    added.push_back(set);
  }

  if (!added.empty()) {
    storage::common::SaveProtoJson(folder / kIndexFileName, index);
  }

  SNAPSHOT_LOG_INFO("collection.sets_added",
                    {StringField("collection", collection_id), UIntField("imported", imported.size()), UIntField("indexed", added.size())});
  return added;
}

std::vector<CollectionStore::CollectionSet> FolderCollectionStore::ListSets(const std::string& collection_id) const {
  const auto path = IndexPath(collection_id);

  std::lock_guard lock(mutex_);
  const auto      index = LoadIndex(path);
  return {index.sets().begin(), index.sets().end()};
}

} // namespace snapshot::exporting
