#include "export_server.hpp"
#include "grpc_error.hpp"
#include "snapshot/manager/v1.hpp"

namespace snapshot::grpc {

ExportServer::ExportServer(std::shared_ptr<snapshot::service::ExportService> svc)
    : service_(std::move(svc)) {}

::grpc::Status ExportServer::AddSnapshotToCollection(::grpc::ServerContext*, const snapshot::manager::v1::AddSnapshotToCollectionRequest* req, snapshot::manager::v1::AddSnapshotToCollectionResponse* resp) {
  try {
    *resp = service_->AddToCollection(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ExportServer::ListCollectionSets(::grpc::ServerContext*, const snapshot::manager::v1::ListCollectionSetsRequest* req, snapshot::manager::v1::ListCollectionSetsResponse* resp) {
  try {
    *resp = service_->ListCollectionSets(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status ExportServer::ZipSnapshot(::grpc::ServerContext*, const snapshot::manager::v1::ZipSnapshotRequest* req, snapshot::manager::v1::ZipSnapshotResponse* resp) {
  try {
    *resp = service_->ZipSnapshot(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

}
