#include <cassert>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <stdexcept>

#include <grpcpp/grpcpp.h>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/export/collection_bridge.hpp"
#include "internal/export/collection_store.hpp"
#include "internal/export/snapshot_archiver.hpp"
#include "internal/grpc/export_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/grpc/job_server.hpp"
#include "internal/grpc/snapshot_server.hpp"
#include "internal/job/job_manager.hpp"
#include "internal/service/export_service.hpp"
#include "internal/service/job_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/snapshot_service.hpp"
#include "snapshot/manager/v1.hpp"
#include "unit/test_workspace.hpp"

namespace {

using namespace snapshot::manager::v1;

struct Harness {
  snapshot::testing::Workspace      ws;
  snapshot::service::ServiceContext ctx;
};

Harness BuildHarness(const std::string& name) {
  Harness h;
  h.ws = snapshot::testing::MakeWorkspace(name);
  snapshot::testing::SeedProject(*h.ws.projects, "p1", 2);
  snapshot::testing::CreateSandbox(h.ws, "p1", "s1");

  snapshot::runtime::config::SchedulerConfig scheduler;
  scheduler.set_worker_threads(1);

  auto collections          = std::make_shared<snapshot::exporting::FolderCollectionStore>(h.ws.root / "collections");
  h.ctx.snapshots           = h.ws.snapshots;
  h.ctx.providers           = h.ws.providers;
  h.ctx.jobs                = std::make_shared<snapshot::job::JobManager>(h.ws.snapshots, h.ws.providers,
                                                                          std::make_shared<snapshot::db::memory::MemoryRepository>(), scheduler);
  h.ctx.collections         = collections;
  h.ctx.collection_bridge   = std::make_shared<snapshot::exporting::CollectionBridge>(h.ws.snapshots, collections, h.ws.root / "collections" / ".staging");
  h.ctx.archiver            = std::make_shared<snapshot::exporting::SnapshotArchiver>(h.ws.snapshots, h.ws.projects);
  return h;
}

Caller WithRights(std::initializer_list<Right> rights) {
  Caller caller;
  caller.set_user("alice");
  for (auto right : rights) {
    caller.add_rights(right);
  }
  return caller;
}

SnapshotRequest SnapshotRequestFor(std::initializer_list<uint32_t> indices) {
  SnapshotRequest req;
  *req.mutable_caller() = WithRights({RIGHT_READ, RIGHT_WRITE});
  req.set_project_id("p1");
  req.set_sandbox_id("s1");
  for (auto index : indices) {
    req.mutable_track()->add_indices(index);
  }
  return req;
}

void TestResolveUnknownTrackReturnsNotFound() {
  auto h = BuildHarness("grpc_unknown_track");
  snapshot::grpc::SnapshotServer server(std::make_shared<snapshot::service::SnapshotService>(h.ctx));

  auto                  req = SnapshotRequestFor({7});
  SnapshotResponse      resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.ResolveSnapshot(&grpc_ctx, &req, &resp);
  assert(status.error_code() == ::grpc::StatusCode::NOT_FOUND);

  req.set_sandbox_id("missing");
  assert(server.ResolveSnapshot(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestResolveRootReturnsView() {
  auto h = BuildHarness("grpc_resolve_root");
  snapshot::grpc::SnapshotServer server(std::make_shared<snapshot::service::SnapshotService>(h.ctx));

  auto                  req = SnapshotRequestFor({});
  SnapshotResponse      resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.ResolveSnapshot(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.snapshot().track().indices_size() == 0);
}

void TestDuplicateSandboxReturnsAlreadyExists() {
  auto h = BuildHarness("grpc_duplicate_sandbox");
  snapshot::grpc::SnapshotServer server(std::make_shared<snapshot::service::SnapshotService>(h.ctx));

  CreateSandboxRequest req;
  *req.mutable_caller() = WithRights({RIGHT_READ, RIGHT_WRITE, RIGHT_EXECUTE});
  req.set_project_id("p1");
  req.set_sandbox_id("s1");
  SandboxResponse       resp;
  ::grpc::ServerContext grpc_ctx;

  assert(server.CreateSandbox(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::ALREADY_EXISTS);
}

void TestInvalidIdReturnsInvalidArgument() {
  auto h = BuildHarness("grpc_invalid_id");
  snapshot::grpc::SnapshotServer server(std::make_shared<snapshot::service::SnapshotService>(h.ctx));

  auto req = SnapshotRequestFor({});
  req.set_project_id("../p1");
  SnapshotResponse      resp;
  ::grpc::ServerContext grpc_ctx;

  assert(server.ResolveSnapshot(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestRemoveLockedSnapshotReturnsAborted() {
  auto h = BuildHarness("grpc_remove_locked");
  snapshot::testing::AppendChild(h.ws, "p1", "s1", snapshot::model::Track::Root(), "gt");
  h.ws.snapshots->Lock("p1", "s1", snapshot::model::Track{0}, "reviewer", "frozen");

  snapshot::grpc::SnapshotServer server(std::make_shared<snapshot::service::SnapshotService>(h.ctx));

  auto                   req = SnapshotRequestFor({0});
  RemoveSnapshotResponse resp;
  ::grpc::ServerContext  grpc_ctx;

  assert(server.RemoveSnapshot(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::ABORTED);
  assert(h.ws.snapshots->Resolve("p1", "s1", snapshot::model::Track{0}).has_lock());
}

void TestBrokenMetsReturnsDataLoss() {
  auto h = BuildHarness("grpc_broken_mets");
  snapshot::testing::WriteFile(h.ws.snapshots->SnapshotsRoot("p1", "s1") / "mets.xml", "<mets:mets><unterminated");

  snapshot::grpc::SnapshotServer server(std::make_shared<snapshot::service::SnapshotService>(h.ctx));

  auto                  req = SnapshotRequestFor({});
  FilesForTrackResponse resp;
  ::grpc::ServerContext grpc_ctx;

  assert(server.GetFilesForTrack(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::DATA_LOSS);
}

void TestScheduleWithoutExecuteReturnsFailedPrecondition() {
  auto h = BuildHarness("grpc_schedule_reader");
  snapshot::grpc::JobServer server(std::make_shared<snapshot::service::JobService>(h.ctx));

  ScheduleJobRequest req;
  *req.mutable_caller() = WithRights({RIGHT_READ});
  req.set_project_id("p1");
  req.set_sandbox_id("s1");
  req.mutable_workflow()->set_provider_id("parent-copy");
  ScheduleJobResponse   resp;
  ::grpc::ServerContext grpc_ctx;

  assert(server.ScheduleJob(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::FAILED_PRECONDITION);

  *req.mutable_caller() = WithRights({RIGHT_EXECUTE});
  req.mutable_workflow()->set_provider_id("no-such-provider");
  assert(server.ScheduleJob(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestUnknownJobReturnsNotFound() {
  auto h = BuildHarness("grpc_unknown_job");
  snapshot::grpc::JobServer server(std::make_shared<snapshot::service::JobService>(h.ctx));

  JobRequest req;
  req.set_job_id(42);
  CancelJobResponse     resp;
  ::grpc::ServerContext grpc_ctx;

  assert(server.CancelJob(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::NOT_FOUND);
}

void TestCollectionFromLauncherReturnsInvalidArgument() {
  auto h = BuildHarness("grpc_collection_launcher");
  snapshot::grpc::ExportServer server(std::make_shared<snapshot::service::ExportService>(h.ctx));

  AddSnapshotToCollectionRequest req;
  *req.mutable_caller() = WithRights({RIGHT_READ});
  req.set_project_id("p1");
  req.set_sandbox_id("s1");
  req.set_collection_id("gt");
  AddSnapshotToCollectionResponse resp;
  ::grpc::ServerContext           grpc_ctx;

  assert(server.AddSnapshotToCollection(&grpc_ctx, &req, &resp).error_code() == ::grpc::StatusCode::INVALID_ARGUMENT);
}

void TestZipSnapshotReturnsArchive() {
  auto h = BuildHarness("grpc_zip");
  snapshot::grpc::ExportServer server(std::make_shared<snapshot::service::ExportService>(h.ctx));

  ZipSnapshotRequest req;
  *req.mutable_caller() = WithRights({RIGHT_READ});
  req.set_project_id("p1");
  req.set_sandbox_id("s1");
  ZipSnapshotResponse   resp;
  ::grpc::ServerContext grpc_ctx;

  const auto status = server.ZipSnapshot(&grpc_ctx, &req, &resp);
  assert(status.ok());
  assert(resp.entries() == 3);
  assert(resp.file_name() == "Project p1_s1_snapshot.zip");
  assert(resp.archive().compare(0, 4, "PK\x03\x04") == 0);
}

void TestUntypedErrorsAreHidden() {
  const auto status = snapshot::grpc::ToStatus(std::runtime_error("disk on fire"));
  assert(status.error_code() == ::grpc::StatusCode::UNAVAILABLE);
  assert(status.error_message() == "service unavailable");
}

} // namespace

int main() {
  TestResolveUnknownTrackReturnsNotFound();
  TestResolveRootReturnsView();
  TestDuplicateSandboxReturnsAlreadyExists();
  TestInvalidIdReturnsInvalidArgument();
  TestRemoveLockedSnapshotReturnsAborted();
  TestBrokenMetsReturnsDataLoss();
  TestScheduleWithoutExecuteReturnsFailedPrecondition();
  TestUnknownJobReturnsNotFound();
  TestCollectionFromLauncherReturnsInvalidArgument();
  TestZipSnapshotReturnsArchive();
  TestUntypedErrorsAreHidden();

  std::cout << "snapshot_manager_unit_grpc_status: pass\n";
  return 0;
}
