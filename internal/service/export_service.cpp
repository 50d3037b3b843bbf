#include "export_service.hpp"

#include <arrow/io/memory.h>

#include "internal/core/access.hpp"
#include "internal/core/snapshot_manager.hpp"
#include "internal/export/collection_bridge.hpp"
#include "internal/export/collection_store.hpp"
#include "internal/export/snapshot_archiver.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "rpc_observer.hpp"

namespace snapshot::service {

using namespace snapshot::manager::v1;

ExportService::ExportService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

AddSnapshotToCollectionResponse ExportService::AddToCollection(const AddSnapshotToCollectionRequest& req) {
  return ObserveRpc("ExportService.AddSnapshotToCollection", req.project_id(), req.sandbox_id(), [&] {
    core::RequireReadable(ctx_.snapshots->GetSandbox(req.project_id(), req.sandbox_id()), core::Rights::Of(req.caller()));

    exporting::AddToCollectionRequest request;
    request.project_id       = req.project_id();
    request.sandbox_id       = req.sandbox_id();
    request.track            = model::Track::FromProto(req.track());
    request.collection_id    = req.collection_id();
    request.folio_ids        = {req.folio_ids().begin(), req.folio_ids().end()};
    request.include_keywords = req.include_keywords();
    request.user             = req.caller().user();

    AddSnapshotToCollectionResponse resp;
    for (auto& set : ctx_.collection_bridge->AddSnapshot(request)) {
      *resp.add_sets() = std::move(set);
    }
    return resp;
  });
}

ListCollectionSetsResponse ExportService::ListCollectionSets(const ListCollectionSetsRequest& req) {
  return ObserveRpc("ExportService.ListCollectionSets", "", "", [&] {
    ListCollectionSetsResponse resp;
    for (auto& set : ctx_.collections->ListSets(req.collection_id())) {
      *resp.add_sets() = std::move(set);
    }
    return resp;
  });
}

ZipSnapshotResponse ExportService::ZipSnapshot(const ZipSnapshotRequest& req) {
  return ObserveRpc("ExportService.ZipSnapshot", req.project_id(), req.sandbox_id(), [&] {
    core::RequireReadable(ctx_.snapshots->GetSandbox(req.project_id(), req.sandbox_id()), core::Rights::Of(req.caller()));

    exporting::ZipOptions options;
    options.normalize_filenames   = req.normalize_filenames();
    options.include_source_images = req.include_source_images();

    auto sink    = storage::common::Unwrap(arrow::io::BufferOutputStream::Create());
    auto summary = ctx_.archiver->Write(req.project_id(), req.sandbox_id(), model::Track::FromProto(req.track()), options, sink);
    auto buffer  = storage::common::Unwrap(sink->Finish());

    ZipSnapshotResponse resp;
    resp.set_file_name(summary.file_name);
    resp.set_archive(buffer->ToString());
    resp.set_entries(summary.entries);
    return resp;
  });
}

}
