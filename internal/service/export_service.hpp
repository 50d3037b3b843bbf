#pragma once

#include "service_context.hpp"
#include "snapshot/manager/v1.hpp"

namespace snapshot::service {

class ExportService {
public:
  explicit ExportService(ServiceContext ctx);

  snapshot::manager::v1::AddSnapshotToCollectionResponse AddToCollection(const snapshot::manager::v1::AddSnapshotToCollectionRequest& req);
  snapshot::manager::v1::ListCollectionSetsResponse ListCollectionSets(const snapshot::manager::v1::ListCollectionSetsRequest& req);
  snapshot::manager::v1::ZipSnapshotResponse ZipSnapshot(const snapshot::manager::v1::ZipSnapshotRequest& req);

private:
  ServiceContext ctx_;
};

}
