#pragma once

#include "snapshot/manager/core/v1/project.pb.h"
#include "snapshot/manager/core/v1/types.pb.h"

#include "snapshot/manager/runtime/v1/job.pb.h"

#include "snapshot/manager/catalog/v1/collection.pb.h"
#include "snapshot/manager/catalog/v1/mets.pb.h"

#include "snapshot/manager/services/v1/export_service.pb.h"
#include "snapshot/manager/services/v1/job_service.pb.h"
#include "snapshot/manager/services/v1/snapshot_service.pb.h"

#include "snapshot/manager/services/v1/export_service.grpc.pb.h"
#include "snapshot/manager/services/v1/job_service.grpc.pb.h"
#include "snapshot/manager/services/v1/snapshot_service.grpc.pb.h"

namespace snapshot::manager::v1 {
using namespace ::snapshot::manager::core::v1;
using namespace ::snapshot::manager::runtime::v1;
using namespace ::snapshot::manager::catalog::v1;
using namespace ::snapshot::manager::services::v1;
}
