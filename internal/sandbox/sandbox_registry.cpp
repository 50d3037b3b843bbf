#include "sandbox_registry.hpp"

#include <algorithm>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/common/proto_json.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace snapshot::sandbox {

namespace {

constexpr const char* kSandboxesFolder = "sandboxes";
constexpr const char* kSandboxFile     = "sandbox.json";
constexpr const char* kSnapshotsFolder = "snapshots";

std::string Key(const std::string& project_id, const std::string& sandbox_id) {
  return project_id + "/" + sandbox_id;
}

} // namespace

SandboxRegistry::SandboxRegistry(std::shared_ptr<project::ProjectRegistry> projects) : projects_(std::move(projects)) {
}

std::filesystem::path SandboxRegistry::SnapshotsFolderOf(const std::filesystem::path& sandbox_folder) {
  return sandbox_folder / kSnapshotsFolder;
}

std::filesystem::path SandboxRegistry::SandboxesFolder(const std::string& project_id) const {
  return projects_->Folder(project_id) / kSandboxesFolder;
}

std::filesystem::path SandboxRegistry::Folder(const std::string& project_id, const std::string& sandbox_id) const {
  return storage::common::ChildFolder(SandboxesFolder(project_id), "sandbox", sandbox_id);
}

std::shared_ptr<Sandbox> SandboxRegistry::Open(const std::string& project_id, const std::string& sandbox_id) {
  const auto folder = Folder(project_id, sandbox_id);

  std::lock_guard<std::mutex> lock(open_mutex_);
  if (auto it = open_.find(Key(project_id, sandbox_id)); it != open_.end()) {
    return it->second;
  }

  if (!std::filesystem::is_regular_file(folder / kSandboxFile)) {
    throw util::NotFound("sandbox not found: " + project_id + "/" + sandbox_id);
  }

  SandboxRecord record;
  storage::common::LoadProtoJson(folder / kSandboxFile, &record);

  tree::SnapshotStore store(SnapshotsFolderOf(folder));
  auto                sandbox = std::make_shared<Sandbox>(std::move(record), folder, store.LoadTree());

  SNAPSHOT_LOG_INFO("sandbox.opened", {observability::StringField("project", project_id), observability::StringField("sandbox", sandbox_id),
                                       observability::UIntField("snapshots", sandbox->Tree().Size())});

  open_.emplace(Key(project_id, sandbox_id), sandbox);
  return sandbox;
}

std::shared_ptr<Sandbox> SandboxRegistry::Create(const SandboxRecord& record, const Populate& populate) {
  const auto folder = Folder(record.project_id(), record.id());

  std::lock_guard<std::mutex> lock(create_mutex_);
  if (std::filesystem::exists(folder)) {
    throw util::AlreadyExists("sandbox already exists: " + record.project_id() + "/" + record.id());
  }

  const auto scratch = SandboxesFolder(record.project_id()) / (".creating-" + util::ToString(util::GenerateUUID()));
  try {
    std::filesystem::create_directories(SnapshotsFolderOf(scratch));
    populate(SnapshotsFolderOf(scratch));
    storage::common::SaveProtoJson(scratch / kSandboxFile, record);
    std::filesystem::rename(scratch, folder);
  } catch (const std::exception&) {
    std::error_code ec;
    std::filesystem::remove_all(scratch, ec);
    if (ec) {
      SNAPSHOT_LOG_WARN("sandbox.scratch_cleanup_failed", {observability::StringField("path", scratch.string()), observability::StringField("error", ec.message())});
    }
    throw;
  }

  SNAPSHOT_LOG_INFO("sandbox.created", {observability::StringField("project", record.project_id()), observability::StringField("sandbox", record.id())});
  return Open(record.project_id(), record.id());
}

std::vector<SandboxRegistry::SandboxRecord> SandboxRegistry::List(const std::string& project_id) const {
  std::vector<SandboxRecord> sandboxes;

  const auto root = SandboxesFolder(project_id);
  if (!std::filesystem::is_directory(root)) {
    return sandboxes;
  }

  for (const auto& entry : std::filesystem::directory_iterator(root)) {
    const auto name = entry.path().filename().string();
    if (!entry.is_directory() || name.empty() || name.front() == '.' || !std::filesystem::is_regular_file(entry.path() / kSandboxFile)) {
      continue;
    }
    SandboxRecord record;
    storage::common::LoadProtoJson(entry.path() / kSandboxFile, &record);
    sandboxes.push_back(std::move(record));
  }

  std::sort(sandboxes.begin(), sandboxes.end(), [](const auto& a, const auto& b) { return a.id() < b.id(); });
  return sandboxes;
}

void SandboxRegistry::Save(const Sandbox& sandbox, const SandboxRecord& record) const {
  storage::common::SaveProtoJson(sandbox.Folder() / kSandboxFile, record);
}

} // namespace snapshot::sandbox
