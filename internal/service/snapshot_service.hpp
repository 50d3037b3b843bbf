#pragma once

#include "service_context.hpp"
#include "snapshot/manager/v1.hpp"

namespace snapshot::service {

class SnapshotService {
public:
  explicit SnapshotService(ServiceContext ctx);

  snapshot::manager::v1::SandboxResponse CreateSandbox(const snapshot::manager::v1::CreateSandboxRequest& req);
  snapshot::manager::v1::SandboxResponse GetSandbox(const snapshot::manager::v1::SandboxRequest& req);
  snapshot::manager::v1::ListSandboxesResponse ListSandboxes(const snapshot::manager::v1::ListSandboxesRequest& req);
  snapshot::manager::v1::SandboxResponse SetSandboxState(const snapshot::manager::v1::SetSandboxStateRequest& req);

  snapshot::manager::v1::SnapshotResponse Resolve(const snapshot::manager::v1::SnapshotRequest& req);
  snapshot::manager::v1::SnapshotListResponse GetDerived(const snapshot::manager::v1::SnapshotRequest& req);
  snapshot::manager::v1::SnapshotListResponse GetPath(const snapshot::manager::v1::SnapshotRequest& req);

  snapshot::manager::v1::RemoveSnapshotResponse Remove(const snapshot::manager::v1::SnapshotRequest& req);
  snapshot::manager::v1::RemoveSnapshotResponse ResetRoot(const snapshot::manager::v1::SandboxRequest& req);
  snapshot::manager::v1::SnapshotResponse Lock(const snapshot::manager::v1::LockSnapshotRequest& req);
  snapshot::manager::v1::SnapshotResponse Unlock(const snapshot::manager::v1::SnapshotRequest& req);
  snapshot::manager::v1::SnapshotResponse UpdateConfiguration(const snapshot::manager::v1::UpdateSnapshotConfigurationRequest& req);

  snapshot::manager::v1::MetsSynopsisResponse MetsSynopsis(const snapshot::manager::v1::SandboxRequest& req);
  snapshot::manager::v1::FilesForTrackResponse FilesForTrack(const snapshot::manager::v1::SnapshotRequest& req);

private:
  snapshot::manager::v1::SandboxRecord RequireReadable(const snapshot::manager::v1::Caller& caller, const std::string& project_id,
                                                       const std::string& sandbox_id);
  snapshot::manager::v1::SandboxRecord RequireMutable(const snapshot::manager::v1::Caller& caller, const std::string& project_id,
                                                      const std::string& sandbox_id);

  ServiceContext ctx_;
};

}
