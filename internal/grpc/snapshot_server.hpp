#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/snapshot_service.hpp"
#include "snapshot/manager/v1.hpp"

namespace snapshot::grpc {

class SnapshotServer final : public snapshot::manager::v1::SnapshotService::Service {
public:
  explicit SnapshotServer(std::shared_ptr<snapshot::service::SnapshotService> svc);

  ::grpc::Status CreateSandbox(::grpc::ServerContext*, const snapshot::manager::v1::CreateSandboxRequest*, snapshot::manager::v1::SandboxResponse*) override;
  ::grpc::Status GetSandbox(::grpc::ServerContext*, const snapshot::manager::v1::SandboxRequest*, snapshot::manager::v1::SandboxResponse*) override;
  ::grpc::Status ListSandboxes(::grpc::ServerContext*, const snapshot::manager::v1::ListSandboxesRequest*, snapshot::manager::v1::ListSandboxesResponse*) override;
  ::grpc::Status SetSandboxState(::grpc::ServerContext*, const snapshot::manager::v1::SetSandboxStateRequest*, snapshot::manager::v1::SandboxResponse*) override;
  ::grpc::Status ResolveSnapshot(::grpc::ServerContext*, const snapshot::manager::v1::SnapshotRequest*, snapshot::manager::v1::SnapshotResponse*) override;
  ::grpc::Status GetDerived(::grpc::ServerContext*, const snapshot::manager::v1::SnapshotRequest*, snapshot::manager::v1::SnapshotListResponse*) override;
  ::grpc::Status GetPath(::grpc::ServerContext*, const snapshot::manager::v1::SnapshotRequest*, snapshot::manager::v1::SnapshotListResponse*) override;
  ::grpc::Status RemoveSnapshot(::grpc::ServerContext*, const snapshot::manager::v1::SnapshotRequest*, snapshot::manager::v1::RemoveSnapshotResponse*) override;
  ::grpc::Status ResetRoot(::grpc::ServerContext*, const snapshot::manager::v1::SandboxRequest*, snapshot::manager::v1::RemoveSnapshotResponse*) override;
  ::grpc::Status LockSnapshot(::grpc::ServerContext*, const snapshot::manager::v1::LockSnapshotRequest*, snapshot::manager::v1::SnapshotResponse*) override;
  ::grpc::Status UnlockSnapshot(::grpc::ServerContext*, const snapshot::manager::v1::SnapshotRequest*, snapshot::manager::v1::SnapshotResponse*) override;
  ::grpc::Status UpdateSnapshotConfiguration(::grpc::ServerContext*, const snapshot::manager::v1::UpdateSnapshotConfigurationRequest*, snapshot::manager::v1::SnapshotResponse*) override;
  ::grpc::Status GetMetsSynopsis(::grpc::ServerContext*, const snapshot::manager::v1::SandboxRequest*, snapshot::manager::v1::MetsSynopsisResponse*) override;
  ::grpc::Status GetFilesForTrack(::grpc::ServerContext*, const snapshot::manager::v1::SnapshotRequest*, snapshot::manager::v1::FilesForTrackResponse*) override;

private:
  std::shared_ptr<snapshot::service::SnapshotService> service_;
};

}
