#include "snapshot_store.hpp"

#include <algorithm>
#include <charconv>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/proto_json.hpp"

namespace snapshot::tree {

namespace {

constexpr const char* kRecordFolder  = ".snapshot";
constexpr const char* kRecordFile    = "snapshot.json";
constexpr const char* kOutputFolder  = "sandbox";
constexpr const char* kDerivedFolder = "derived";

bool ParseIndex(const std::string& name, model::Track::Index* index) {
  if (name.empty() || (name.size() > 1 && name.front() == '0')) {
    return false;
  }
  auto [ptr, ec] = std::from_chars(name.data(), name.data() + name.size(), *index);
  return ec == std::errc{} && ptr == name.data() + name.size();
}

} // namespace

SnapshotStore::SnapshotStore(std::filesystem::path root) : root_(std::move(root)) {
}

std::filesystem::path SnapshotStore::Folder(const model::Track& track) const {
  auto folder = root_;
  for (auto index : track.Indices()) {
    folder = folder / kDerivedFolder / std::to_string(index);
  }
  return folder;
}

std::filesystem::path SnapshotStore::OutputFolder(const model::Track& track) const {
  return OutputFolderOf(Folder(track));
}

std::filesystem::path SnapshotStore::RecordPath(const model::Track& track) const {
  return Folder(track) / kRecordFolder / kRecordFile;
}

std::filesystem::path SnapshotStore::DerivedFolder(const model::Track& track) const {
  return Folder(track) / kDerivedFolder;
}

std::string SnapshotStore::RelativeOutputPath(const model::Track& track, const std::string& file_name) const {
  return (OutputFolder(track) / file_name).lexically_relative(root_).generic_string();
}

SnapshotStore::SnapshotRecord SnapshotStore::LoadRecord(const model::Track& track) const {
  SnapshotRecord record;
  storage::common::LoadProtoJson(RecordPath(track), &record);
  return record;
}

void SnapshotStore::SaveRecord(const model::Track& track, const SnapshotRecord& record) const {
  SaveRecordAt(Folder(track), record);
}

void SnapshotStore::Prepare(const std::filesystem::path& folder) {
  std::filesystem::create_directories(folder / kRecordFolder);
  std::filesystem::create_directories(folder / kOutputFolder);
}

void SnapshotStore::SaveRecordAt(const std::filesystem::path& folder, const SnapshotRecord& record) {
  std::filesystem::create_directories(folder / kRecordFolder);
  storage::common::SaveProtoJson(folder / kRecordFolder / kRecordFile, record);
}

std::filesystem::path SnapshotStore::OutputFolderOf(const std::filesystem::path& folder) {
  return folder / kOutputFolder;
}

SnapshotTree SnapshotStore::LoadTree() const {
  SnapshotTree tree(LoadRecord(model::Track::Root()));
  LoadChildren(&tree, model::Track::Root());
  return tree;
}

void SnapshotStore::LoadChildren(SnapshotTree* tree, const model::Track& parent) const {
  const auto derived = DerivedFolder(parent);
  if (!std::filesystem::is_directory(derived)) {
    return;
  }

  std::vector<model::Track::Index> indices;
  for (const auto& entry : std::filesystem::directory_iterator(derived)) {
    model::Track::Index index = 0;
    if (!entry.is_directory() || !ParseIndex(entry.path().filename().string(), &index)) {
      SNAPSHOT_LOG_WARN("snapshot.folder_skipped", {observability::StringField("path", entry.path().string())});
      continue;
    }
    indices.push_back(index);
  }
  std::sort(indices.begin(), indices.end());

  for (auto index : indices) {
    const auto track = parent.Child(index);
    if (!std::filesystem::is_regular_file(RecordPath(track))) {
      SNAPSHOT_LOG_WARN("snapshot.record_missing", {observability::StringField("path", Folder(track).string())});
      continue;
    }
    tree->Insert(track, LoadRecord(track));
    LoadChildren(tree, track);
  }
}

} // namespace snapshot::tree
