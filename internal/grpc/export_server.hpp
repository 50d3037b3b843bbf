#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "internal/service/export_service.hpp"
#include "snapshot/manager/v1.hpp"

namespace snapshot::grpc {

class ExportServer final : public snapshot::manager::v1::ExportService::Service {
public:
  explicit ExportServer(std::shared_ptr<snapshot::service::ExportService> svc);

  ::grpc::Status AddSnapshotToCollection(::grpc::ServerContext*, const snapshot::manager::v1::AddSnapshotToCollectionRequest*, snapshot::manager::v1::AddSnapshotToCollectionResponse*) override;
  ::grpc::Status ListCollectionSets(::grpc::ServerContext*, const snapshot::manager::v1::ListCollectionSetsRequest*, snapshot::manager::v1::ListCollectionSetsResponse*) override;
  ::grpc::Status ZipSnapshot(::grpc::ServerContext*, const snapshot::manager::v1::ZipSnapshotRequest*, snapshot::manager::v1::ZipSnapshotResponse*) override;

private:
  std::shared_ptr<snapshot::service::ExportService> service_;
};

}
