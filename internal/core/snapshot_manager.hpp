#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/mets/mets_adapter.hpp"
#include "internal/model/step_output.hpp"
#include "internal/model/track.hpp"
#include "internal/project/project_registry.hpp"
#include "internal/sandbox/sandbox_registry.hpp"
#include "snapshot/manager/v1.hpp"

namespace snapshot::core {

struct CreateSandboxParams {
  std::string project_id;
  std::string sandbox_id;
  std::string name;
  std::string mets_group;
  std::string file_group_template;
  std::string user;
  std::string root_provider_id;
  std::string root_label;
};

// Completed step output waiting to become a child snapshot.
struct AppendRequest {
  std::string                                 project_id;
  std::string                                 sandbox_id;
  model::Track                                parent;
  // uid the parent had when the step was scheduled. Empty skips the check.
  std::string                                 parent_uid;
  snapshot::manager::core::v1::SnapshotRecord record;
  // Prepared snapshot folder (see SnapshotStore::Prepare) holding the output.
  std::filesystem::path staging_folder;
  model::StepOutput     output;
  mets::ProcessorInfo   processor;
  // Runs under the sandbox lock right before the output is moved into
  // the tree. Throwing aborts the append.
  std::function<void()> before_publish;
};

/*
  SnapshotManager

  Snapshot tree operations of all sandboxes. Every call opens the
  sandbox through the registry and takes its mutex: shared for reads,
  exclusive for any change of tree, records or METS document. Provider
  work never runs under the lock; Append only publishes finished output.
*/
class SnapshotManager {
 public:
  using RootPopulator = std::function<model::StepOutput(const snapshot::manager::v1::ProjectRecord& project, const std::filesystem::path& output_folder)>;

  SnapshotManager(std::shared_ptr<project::ProjectRegistry> projects, std::shared_ptr<sandbox::SandboxRegistry> sandboxes,
                  snapshot::runtime::config::SandboxDefaultsConfig defaults);

  // ------------------------------------------------------------
  // Projects and sandboxes
  // ------------------------------------------------------------

  snapshot::manager::v1::ProjectRecord GetProject(const std::string& project_id) const;

  snapshot::manager::v1::SandboxRecord              CreateSandbox(const CreateSandboxParams& params, const RootPopulator& populate);
  snapshot::manager::v1::SandboxRecord              GetSandbox(const std::string& project_id, const std::string& sandbox_id);
  std::vector<snapshot::manager::v1::SandboxRecord> ListSandboxes(const std::string& project_id) const;
  snapshot::manager::v1::SandboxRecord SetSandboxState(const std::string& project_id, const std::string& sandbox_id, snapshot::manager::v1::SandboxState state);

  // ------------------------------------------------------------
  // Navigation
  // ------------------------------------------------------------

  snapshot::manager::v1::SnapshotView              Resolve(const std::string& project_id, const std::string& sandbox_id, const model::Track& track);
  std::vector<snapshot::manager::v1::SnapshotView> GetDerived(const std::string& project_id, const std::string& sandbox_id, const model::Track& track);
  std::vector<snapshot::manager::v1::SnapshotView> GetPath(const std::string& project_id, const std::string& sandbox_id, const model::Track& track);
  snapshot::manager::v1::SnapshotRecord            GetRecord(const std::string& project_id, const std::string& sandbox_id, const model::Track& track);
  std::filesystem::path                            OutputFolder(const std::string& project_id, const std::string& sandbox_id, const model::Track& track);
  std::filesystem::path                            SnapshotsRoot(const std::string& project_id, const std::string& sandbox_id);

  // ------------------------------------------------------------
  // Mutation
  // ------------------------------------------------------------

  // Removing the root track resets the root. Returns the removed tracks.
  std::vector<model::Track> Remove(const std::string& project_id, const std::string& sandbox_id, const model::Track& track);
  std::vector<model::Track> ResetRoot(const std::string& project_id, const std::string& sandbox_id);

  snapshot::manager::v1::SnapshotView Lock(const std::string& project_id, const std::string& sandbox_id, const model::Track& track, const std::string& source,
                                           const std::string& comment);
  snapshot::manager::v1::SnapshotView Unlock(const std::string& project_id, const std::string& sandbox_id, const model::Track& track);
  snapshot::manager::v1::SnapshotView UpdateConfiguration(const std::string& project_id, const std::string& sandbox_id, const model::Track& track,
                                                          const std::string& label, const std::string& description);

  // ------------------------------------------------------------
  // Job completion
  // ------------------------------------------------------------

  // Returns the parent's uid. Throws util::TrackNotFound, or
  // util::Conflict when the parent is locked.
  std::string CheckAppendable(const std::string& project_id, const std::string& sandbox_id, const model::Track& parent);

  std::filesystem::path CreateStagingFolder(const std::string& project_id, const std::string& sandbox_id);
  void                  DiscardStagingFolder(const std::filesystem::path& folder) const;

  // Publishes staged output as the next child of request.parent and
  // returns the new track. Throws util::TrackNotFound when the parent is
  // gone, including when its track now names a different snapshot.
  model::Track Append(const AppendRequest& request);

  // ------------------------------------------------------------
  // METS
  // ------------------------------------------------------------

  std::vector<snapshot::manager::v1::ProcessorSynopsis> MetsSynopsis(const std::string& project_id, const std::string& sandbox_id);
  snapshot::manager::v1::MetsFileGroup FilesForTrack(const std::string& project_id, const std::string& sandbox_id, const model::Track& track);

 private:
  std::shared_ptr<sandbox::Sandbox> Open(const std::string& project_id, const std::string& sandbox_id);

  // Caller holds the sandbox exclusively.
  std::vector<model::Track> RemoveLocked(sandbox::Sandbox& sandbox, const model::Track& track);
  void                      SaveRecordLocked(sandbox::Sandbox& sandbox, const model::Track& track, snapshot::manager::v1::SnapshotRecord record);

  std::shared_ptr<project::ProjectRegistry>        projects_;
  std::shared_ptr<sandbox::SandboxRegistry>        sandboxes_;
  snapshot::runtime::config::SandboxDefaultsConfig defaults_;
};

} // namespace snapshot::core
