#include "snapshot_manager.hpp"

#include <google/protobuf/util/time_util.h>

#include <mutex>
#include <optional>
#include <shared_mutex>
#include <system_error>

#include "internal/mets/file_group_naming.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/model/step_kind.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace snapshot::core {

using namespace snapshot::manager::v1;
using observability::StringField;
using observability::UIntField;

namespace {

std::string Trim(const std::string& value) {
  const auto first = value.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return {};
  const auto last = value.find_last_not_of(" \t\r\n");
  return value.substr(first, last - first + 1);
}

std::optional<mets::MetsDocument> LoadMetsIfPresent(const sandbox::Sandbox& sandbox) {
  if (!std::filesystem::exists(sandbox.MetsPath())) {
    return std::nullopt;
  }
  return mets::MetsAdapter::Load(sandbox.MetsPath());
}

std::vector<mets::OutputFile> ToOutputFiles(const tree::SnapshotStore& store, const model::Track& track, const model::StepOutput& output) {
  std::vector<mets::OutputFile> files;
  files.reserve(output.files.size());
  for (const auto& produced : output.files) {
    files.push_back({produced.folio_id, store.RelativeOutputPath(track, produced.file_name), produced.mime_type});
  }
  return files;
}

void RemoveQuietly(const std::filesystem::path& path, const char* event) {
  std::error_code ec;
  std::filesystem::remove_all(path, ec);
  if (ec) {
    SNAPSHOT_LOG_WARN(event, {StringField("path", path.string()), StringField("error", ec.message())});
  }
}

} // namespace

SnapshotManager::SnapshotManager(std::shared_ptr<project::ProjectRegistry> projects, std::shared_ptr<sandbox::SandboxRegistry> sandboxes,
                                 snapshot::runtime::config::SandboxDefaultsConfig defaults)
    : projects_(std::move(projects)), sandboxes_(std::move(sandboxes)), defaults_(std::move(defaults)) {
}

std::shared_ptr<sandbox::Sandbox> SnapshotManager::Open(const std::string& project_id, const std::string& sandbox_id) {
  return sandboxes_->Open(project_id, sandbox_id);
}

// ------------------------------------------------------------
// Projects and sandboxes
// ------------------------------------------------------------

ProjectRecord SnapshotManager::GetProject(const std::string& project_id) const {
  return projects_->Get(project_id);
}

SandboxRecord SnapshotManager::CreateSandbox(const CreateSandboxParams& params, const RootPopulator& populate) {
  const auto project = projects_->Get(params.project_id);
  storage::common::ValidateFolderName("sandbox", params.sandbox_id);

  const auto now = util::ToProto(util::Now());

  SandboxRecord record;
  record.set_id(params.sandbox_id);
  record.set_project_id(project.id());
  record.set_name(params.name.empty() ? params.sandbox_id : params.name);
  record.set_state(SANDBOX_STATE_ACTIVE);
  record.set_mets_file_name(defaults_.mets_file_name());
  record.set_mets_group(params.mets_group.empty() ? defaults_.mets_group() : params.mets_group);
  record.set_file_group_template(params.file_group_template.empty() ? defaults_.file_group_template() : params.file_group_template);
  record.set_user(params.user);
  *record.mutable_created() = now;
  *record.mutable_updated() = now;
  mets::ValidateFileGroupTemplate(record.file_group_template());
  mets::ValidateMetsGroup(record.mets_group());

  sandboxes_->Create(record, [&](const std::filesystem::path& snapshots_root) {
    tree::SnapshotStore::Prepare(snapshots_root);
    const auto output = populate(project, tree::SnapshotStore::OutputFolderOf(snapshots_root));

    SnapshotRecord root;
    root.set_kind(STEP_KIND_LAUNCHER);
    root.set_label(params.root_label.empty() ? params.root_provider_id : params.root_label);
    root.set_provider_id(params.root_provider_id);
    root.set_user(params.user);
    root.set_uid(util::ToString(util::GenerateUUID()));
    *root.mutable_created() = now;
    *root.mutable_updated() = now;
    tree::SnapshotStore::SaveRecordAt(snapshots_root, root);

    mets::MetsDocument document(google::protobuf::util::TimeUtil::ToString(now));
    const auto         naming = mets::PageNamingFor(record.mets_group());
    for (const auto& folio : project.folios()) {
      document.EnsurePage(naming->PageForFolio(folio.id()));
    }

    tree::SnapshotStore store(snapshots_root);
    mets::MetsAdapter::AddFileGroup(&document, record, model::Track::Root(), ToOutputFiles(store, model::Track::Root(), output),
                                    {params.root_provider_id, std::string(model::StepKindName(STEP_KIND_LAUNCHER)), ""});
    mets::MetsAdapter::Save(snapshots_root / record.mets_file_name(), document);
  });

  return record;
}

SandboxRecord SnapshotManager::GetSandbox(const std::string& project_id, const std::string& sandbox_id) {
  auto                                sandbox = Open(project_id, sandbox_id);
  std::shared_lock<std::shared_mutex> lock(sandbox->Mutex());
  return sandbox->Record();
}

std::vector<SandboxRecord> SnapshotManager::ListSandboxes(const std::string& project_id) const {
  projects_->Get(project_id);
  return sandboxes_->List(project_id);
}

SandboxRecord SnapshotManager::SetSandboxState(const std::string& project_id, const std::string& sandbox_id, SandboxState state) {
  auto                                sandbox = Open(project_id, sandbox_id);
  std::unique_lock<std::shared_mutex> lock(sandbox->Mutex());

  auto record = sandbox->Record();
  if (!model::CanTransition(record.state(), state)) {
    throw util::Conflict("sandbox " + sandbox_id + " cannot move from " + SandboxState_Name(record.state()) + " to " + SandboxState_Name(state));
  }

  const auto now = util::ToProto(util::Now());
  record.set_state(state);
  *record.mutable_updated() = now;
  if (model::IsDone(state)) {
    *record.mutable_done() = now;
  } else {
    record.clear_done();
  }

  sandboxes_->Save(*sandbox, record);
  sandbox->SetRecord(record);
  return record;
}

// ------------------------------------------------------------
// Navigation
// ------------------------------------------------------------

SnapshotView SnapshotManager::Resolve(const std::string& project_id, const std::string& sandbox_id, const model::Track& track) {
  auto                                sandbox = Open(project_id, sandbox_id);
  std::shared_lock<std::shared_mutex> lock(sandbox->Mutex());
  return sandbox->Tree().View(track);
}

std::vector<SnapshotView> SnapshotManager::GetDerived(const std::string& project_id, const std::string& sandbox_id, const model::Track& track) {
  auto                                sandbox = Open(project_id, sandbox_id);
  std::shared_lock<std::shared_mutex> lock(sandbox->Mutex());

  std::vector<SnapshotView> views;
  for (const auto& child : sandbox->Tree().Derived(track)) {
    views.push_back(sandbox->Tree().View(child));
  }
  return views;
}

std::vector<SnapshotView> SnapshotManager::GetPath(const std::string& project_id, const std::string& sandbox_id, const model::Track& track) {
  auto                                sandbox = Open(project_id, sandbox_id);
  std::shared_lock<std::shared_mutex> lock(sandbox->Mutex());

  std::vector<SnapshotView> views;
  for (const auto& step : sandbox->Tree().Path(track)) {
    views.push_back(sandbox->Tree().View(step));
  }
  return views;
}

SnapshotRecord SnapshotManager::GetRecord(const std::string& project_id, const std::string& sandbox_id, const model::Track& track) {
  auto                                sandbox = Open(project_id, sandbox_id);
  std::shared_lock<std::shared_mutex> lock(sandbox->Mutex());
  return sandbox->Tree().Resolve(track).record;
}

std::filesystem::path SnapshotManager::OutputFolder(const std::string& project_id, const std::string& sandbox_id, const model::Track& track) {
  auto                                sandbox = Open(project_id, sandbox_id);
  std::shared_lock<std::shared_mutex> lock(sandbox->Mutex());
  sandbox->Tree().Resolve(track);
  return sandbox->Store().OutputFolder(track);
}

std::filesystem::path SnapshotManager::SnapshotsRoot(const std::string& project_id, const std::string& sandbox_id) {
  return Open(project_id, sandbox_id)->Store().Root();
}

// ------------------------------------------------------------
// Mutation
// ------------------------------------------------------------

std::vector<model::Track> SnapshotManager::Remove(const std::string& project_id, const std::string& sandbox_id, const model::Track& track) {
  auto                                sandbox = Open(project_id, sandbox_id);
  std::unique_lock<std::shared_mutex> lock(sandbox->Mutex());
  return RemoveLocked(*sandbox, track);
}

std::vector<model::Track> SnapshotManager::ResetRoot(const std::string& project_id, const std::string& sandbox_id) {
  auto                                sandbox = Open(project_id, sandbox_id);
  std::unique_lock<std::shared_mutex> lock(sandbox->Mutex());
  return RemoveLocked(*sandbox, model::Track::Root());
}

std::vector<model::Track> SnapshotManager::RemoveLocked(sandbox::Sandbox& sandbox, const model::Track& track) {
  auto& tree = sandbox.Tree();

  // a locked root does not block a reset, its locked descendants do
  const auto guarded = track.IsRoot() ? tree.Derived(track) : std::vector<model::Track>{track};
  for (const auto& top : guarded) {
    if (tree.AnyLocked(top)) {
      throw util::Conflict("snapshot " + top.ToString() + " or one of its descendants is locked");
    }
  }

  auto removed = tree.Subtree(track);
  if (track.IsRoot()) {
    removed.erase(removed.begin());
  }
  if (removed.empty()) {
    return removed;
  }

  auto document = LoadMetsIfPresent(sandbox);
  if (document) {
    mets::MetsAdapter::RemoveTracks(&*document, sandbox.Record(), removed);
  }

  // move the folders aside first so a failed METS write can be undone
  const auto folder = track.IsRoot() ? sandbox.Store().DerivedFolder(track) : sandbox.Store().Folder(track);
  const auto trash  = sandbox.StagingRoot() / ("removed-" + util::ToString(util::GenerateUUID()));
  std::filesystem::create_directories(sandbox.StagingRoot());
  const bool moved = std::filesystem::exists(folder);
  if (moved) {
    std::filesystem::rename(folder, trash);
  }

  if (document) {
    try {
      mets::MetsAdapter::Save(sandbox.MetsPath(), *document);
    } catch (const std::exception&) {
      if (moved) {
        std::filesystem::rename(trash, folder);
      }
      throw;
    }
  }

  tree.Remove(track);
  if (moved) {
    RemoveQuietly(trash, "snapshot.trash_cleanup_failed");
  }

  SNAPSHOT_LOG_INFO("snapshot.removed", {StringField("project", sandbox.Record().project_id()), StringField("sandbox", sandbox.Record().id()),
                                         StringField("track", track.ToString()), UIntField("snapshots", removed.size())});
  return removed;
}

void SnapshotManager::SaveRecordLocked(sandbox::Sandbox& sandbox, const model::Track& track, SnapshotRecord record) {
  *record.mutable_updated() = util::ToProto(util::Now());
  sandbox.Store().SaveRecord(track, record);
  sandbox.Tree().Resolve(track).record = std::move(record);
}

SnapshotView SnapshotManager::Lock(const std::string& project_id, const std::string& sandbox_id, const model::Track& track, const std::string& source,
                                   const std::string& comment) {
  const auto trimmed_source = Trim(source);
  if (trimmed_source.empty()) {
    throw util::BadRequest("lock source is required");
  }

  auto                                sandbox = Open(project_id, sandbox_id);
  std::unique_lock<std::shared_mutex> lock(sandbox->Mutex());

  auto record = sandbox->Tree().Resolve(track).record;
  if (record.has_lock()) {
    throw util::Conflict("snapshot " + track.ToString() + " is already locked by " + record.lock().source());
  }

  auto* info = record.mutable_lock();
  info->set_source(trimmed_source);
  if (auto trimmed_comment = Trim(comment); !trimmed_comment.empty()) {
    info->set_comment(trimmed_comment);
  }
  *info->mutable_locked_at() = util::ToProto(util::Now());

  SaveRecordLocked(*sandbox, track, std::move(record));
  return sandbox->Tree().View(track);
}

SnapshotView SnapshotManager::Unlock(const std::string& project_id, const std::string& sandbox_id, const model::Track& track) {
  auto                                sandbox = Open(project_id, sandbox_id);
  std::unique_lock<std::shared_mutex> lock(sandbox->Mutex());

  auto record = sandbox->Tree().Resolve(track).record;
  if (!record.has_lock()) {
    throw util::Conflict("snapshot " + track.ToString() + " is not locked");
  }
  record.clear_lock();

  SaveRecordLocked(*sandbox, track, std::move(record));
  return sandbox->Tree().View(track);
}

SnapshotView SnapshotManager::UpdateConfiguration(const std::string& project_id, const std::string& sandbox_id, const model::Track& track,
                                                  const std::string& label, const std::string& description) {
  const auto trimmed_label = Trim(label);
  if (trimmed_label.empty()) {
    throw util::BadRequest("snapshot label is required");
  }

  auto                                sandbox = Open(project_id, sandbox_id);
  std::unique_lock<std::shared_mutex> lock(sandbox->Mutex());

  auto record = sandbox->Tree().Resolve(track).record;
  if (record.has_lock()) {
    throw util::Conflict("snapshot " + track.ToString() + " is locked by " + record.lock().source());
  }

  record.set_label(trimmed_label);
  if (auto trimmed_description = Trim(description); !trimmed_description.empty()) {
    record.set_description(trimmed_description);
  } else {
    record.clear_description();
  }

  SaveRecordLocked(*sandbox, track, std::move(record));
  return sandbox->Tree().View(track);
}

// ------------------------------------------------------------
// Job completion
// ------------------------------------------------------------

std::string SnapshotManager::CheckAppendable(const std::string& project_id, const std::string& sandbox_id, const model::Track& parent) {
  auto                                sandbox = Open(project_id, sandbox_id);
  std::shared_lock<std::shared_mutex> lock(sandbox->Mutex());

  const auto& node = sandbox->Tree().Resolve(parent);
  if (node.record.has_lock()) {
    throw util::Conflict("snapshot " + parent.ToString() + " is locked by " + node.record.lock().source());
  }
  return node.record.uid();
}

std::filesystem::path SnapshotManager::CreateStagingFolder(const std::string& project_id, const std::string& sandbox_id) {
  auto       sandbox = Open(project_id, sandbox_id);
  const auto folder  = sandbox->StagingRoot() / util::ToString(util::GenerateUUID());
  tree::SnapshotStore::Prepare(folder);
  return folder;
}

void SnapshotManager::DiscardStagingFolder(const std::filesystem::path& folder) const {
  RemoveQuietly(folder, "snapshot.staging_cleanup_failed");
}

model::Track SnapshotManager::Append(const AppendRequest& request) {
  auto                                sandbox = Open(request.project_id, request.sandbox_id);
  std::unique_lock<std::shared_mutex> lock(sandbox->Mutex());

  // the parent may have been removed while the step was running, and
  // its track handed to a new snapshot since
  auto&       tree   = sandbox->Tree();
  const auto& parent = tree.Resolve(request.parent);
  if (!request.parent_uid.empty() && parent.record.uid() != request.parent_uid) {
    throw util::TrackNotFound("snapshot " + request.parent.ToString() + " was replaced");
  }
  const auto track = tree.NextChild(request.parent);

  auto       record = request.record;
  const auto now    = util::ToProto(util::Now());
  if (record.uid().empty()) {
    record.set_uid(util::ToString(util::GenerateUUID()));
  }
  *record.mutable_created() = now;
  *record.mutable_updated() = now;
  tree::SnapshotStore::SaveRecordAt(request.staging_folder, record);

  auto document = mets::MetsAdapter::Load(sandbox->MetsPath());
  mets::MetsAdapter::AddFileGroup(&document, sandbox->Record(), track, ToOutputFiles(sandbox->Store(), track, request.output), request.processor);

  if (request.before_publish) {
    request.before_publish();
  }

  const auto target = sandbox->Store().Folder(track);
  if (std::filesystem::exists(target)) {
    // left behind by an interrupted append; it was never part of the tree
    SNAPSHOT_LOG_WARN("snapshot.stale_folder_replaced", {StringField("path", target.string())});
    std::filesystem::remove_all(target);
  }
  std::filesystem::create_directories(target.parent_path());
  std::filesystem::rename(request.staging_folder, target);

  try {
    mets::MetsAdapter::Save(sandbox->MetsPath(), document);
  } catch (const std::exception&) {
    RemoveQuietly(target, "snapshot.append_rollback_failed");
    throw;
  }

  tree.Insert(track, std::move(record));

  SNAPSHOT_LOG_INFO("snapshot.appended", {StringField("project", request.project_id), StringField("sandbox", request.sandbox_id),
                                          StringField("track", track.ToString()), UIntField("files", request.output.files.size())});
  return track;
}

// ------------------------------------------------------------
// METS
// ------------------------------------------------------------

std::vector<ProcessorSynopsis> SnapshotManager::MetsSynopsis(const std::string& project_id, const std::string& sandbox_id) {
  auto                                sandbox = Open(project_id, sandbox_id);
  std::shared_lock<std::shared_mutex> lock(sandbox->Mutex());
  return mets::MetsAdapter::Synopsis(mets::MetsAdapter::Load(sandbox->MetsPath()), sandbox->Record());
}

MetsFileGroup SnapshotManager::FilesForTrack(const std::string& project_id, const std::string& sandbox_id, const model::Track& track) {
  auto                                sandbox = Open(project_id, sandbox_id);
  std::shared_lock<std::shared_mutex> lock(sandbox->Mutex());
  sandbox->Tree().Resolve(track);
  return mets::MetsAdapter::FilesForTrack(mets::MetsAdapter::Load(sandbox->MetsPath()), sandbox->Record(), track);
}

} // namespace snapshot::core
