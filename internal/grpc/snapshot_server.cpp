#include "snapshot_server.hpp"
#include "grpc_error.hpp"
#include "snapshot/manager/v1.hpp"

namespace snapshot::grpc {

SnapshotServer::SnapshotServer(std::shared_ptr<snapshot::service::SnapshotService> svc)
    : service_(std::move(svc)) {}

::grpc::Status SnapshotServer::CreateSandbox(::grpc::ServerContext*, const snapshot::manager::v1::CreateSandboxRequest* req, snapshot::manager::v1::SandboxResponse* resp) {
  try {
    *resp = service_->CreateSandbox(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SnapshotServer::GetSandbox(::grpc::ServerContext*, const snapshot::manager::v1::SandboxRequest* req, snapshot::manager::v1::SandboxResponse* resp) {
  try {
    *resp = service_->GetSandbox(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SnapshotServer::ListSandboxes(::grpc::ServerContext*, const snapshot::manager::v1::ListSandboxesRequest* req, snapshot::manager::v1::ListSandboxesResponse* resp) {
  try {
    *resp = service_->ListSandboxes(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SnapshotServer::SetSandboxState(::grpc::ServerContext*, const snapshot::manager::v1::SetSandboxStateRequest* req, snapshot::manager::v1::SandboxResponse* resp) {
  try {
    *resp = service_->SetSandboxState(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SnapshotServer::ResolveSnapshot(::grpc::ServerContext*, const snapshot::manager::v1::SnapshotRequest* req, snapshot::manager::v1::SnapshotResponse* resp) {
  try {
    *resp = service_->Resolve(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SnapshotServer::GetDerived(::grpc::ServerContext*, const snapshot::manager::v1::SnapshotRequest* req, snapshot::manager::v1::SnapshotListResponse* resp) {
  try {
    *resp = service_->GetDerived(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SnapshotServer::GetPath(::grpc::ServerContext*, const snapshot::manager::v1::SnapshotRequest* req, snapshot::manager::v1::SnapshotListResponse* resp) {
  try {
    *resp = service_->GetPath(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SnapshotServer::RemoveSnapshot(::grpc::ServerContext*, const snapshot::manager::v1::SnapshotRequest* req, snapshot::manager::v1::RemoveSnapshotResponse* resp) {
  try {
    *resp = service_->Remove(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SnapshotServer::ResetRoot(::grpc::ServerContext*, const snapshot::manager::v1::SandboxRequest* req, snapshot::manager::v1::RemoveSnapshotResponse* resp) {
  try {
    *resp = service_->ResetRoot(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SnapshotServer::LockSnapshot(::grpc::ServerContext*, const snapshot::manager::v1::LockSnapshotRequest* req, snapshot::manager::v1::SnapshotResponse* resp) {
  try {
    *resp = service_->Lock(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SnapshotServer::UnlockSnapshot(::grpc::ServerContext*, const snapshot::manager::v1::SnapshotRequest* req, snapshot::manager::v1::SnapshotResponse* resp) {
  try {
    *resp = service_->Unlock(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SnapshotServer::UpdateSnapshotConfiguration(::grpc::ServerContext*, const snapshot::manager::v1::UpdateSnapshotConfigurationRequest* req, snapshot::manager::v1::SnapshotResponse* resp) {
  try {
    *resp = service_->UpdateConfiguration(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SnapshotServer::GetMetsSynopsis(::grpc::ServerContext*, const snapshot::manager::v1::SandboxRequest* req, snapshot::manager::v1::MetsSynopsisResponse* resp) {
  try {
    *resp = service_->MetsSynopsis(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status SnapshotServer::GetFilesForTrack(::grpc::ServerContext*, const snapshot::manager::v1::SnapshotRequest* req, snapshot::manager::v1::FilesForTrackResponse* resp) {
  try {
    *resp = service_->FilesForTrack(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
