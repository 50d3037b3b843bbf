#include "snapshot_service.hpp"

#include "internal/core/access.hpp"
#include "internal/core/snapshot_manager.hpp"
#include "internal/job/provider_registry.hpp"
#include "internal/model/track.hpp"
#include "rpc_observer.hpp"

namespace snapshot::service {

using namespace snapshot::manager::v1;

namespace {

model::Track TrackOf(const SnapshotRequest& req) {
  return model::Track::FromProto(req.track());
}

void AddViews(const std::vector<SnapshotView>& views, SnapshotListResponse* resp) {
  for (const auto& view : views) {
    *resp->add_snapshots() = view;
  }
}

} // namespace

SnapshotService::SnapshotService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SandboxRecord SnapshotService::RequireReadable(const Caller& caller, const std::string& project_id, const std::string& sandbox_id) {
  auto sandbox = ctx_.snapshots->GetSandbox(project_id, sandbox_id);
  core::RequireReadable(sandbox, core::Rights::Of(caller));
  return sandbox;
}

SandboxRecord SnapshotService::RequireMutable(const Caller& caller, const std::string& project_id, const std::string& sandbox_id) {
  auto sandbox = ctx_.snapshots->GetSandbox(project_id, sandbox_id);
  core::RequireMutable(sandbox, core::Rights::Of(caller));
  return sandbox;
}

// ------------------------------------------------------------
// Sandboxes
// ------------------------------------------------------------

SandboxResponse SnapshotService::CreateSandbox(const CreateSandboxRequest& req) {
  return ObserveRpc("SnapshotService.CreateSandbox", req.project_id(), req.sandbox_id(), [&] {
    core::RequireSandboxCreation(ctx_.snapshots->GetProject(req.project_id()), core::Rights::Of(req.caller()));

    const auto launcher = ctx_.providers->Launcher();

    core::CreateSandboxParams params;
    params.project_id          = req.project_id();
    params.sandbox_id          = req.sandbox_id();
    params.name                = req.name();
    params.mets_group          = req.mets_group();
    params.file_group_template = req.file_group_template();
    params.user                = req.caller().user();
    params.root_provider_id    = launcher->Id();
    params.root_label          = launcher->Label();

    SandboxResponse resp;
    *resp.mutable_sandbox() = ctx_.snapshots->CreateSandbox(params, ctx_.providers->RootPopulator());
    *resp.mutable_root()    = ctx_.snapshots->Resolve(req.project_id(), req.sandbox_id(), model::Track::Root());
    return resp;
  });
}

SandboxResponse SnapshotService::GetSandbox(const SandboxRequest& req) {
  return ObserveRpc("SnapshotService.GetSandbox", req.project_id(), req.sandbox_id(), [&] {
    SandboxResponse resp;
    *resp.mutable_sandbox() = RequireReadable(req.caller(), req.project_id(), req.sandbox_id());
    *resp.mutable_root()    = ctx_.snapshots->Resolve(req.project_id(), req.sandbox_id(), model::Track::Root());
    return resp;
  });
}

ListSandboxesResponse SnapshotService::ListSandboxes(const ListSandboxesRequest& req) {
  return ObserveRpc("SnapshotService.ListSandboxes", req.project_id(), "", [&] {
    const auto rights = core::Rights::Of(req.caller());

    ListSandboxesResponse resp;
    for (const auto& sandbox : ctx_.snapshots->ListSandboxes(req.project_id())) {
      if (core::CanRead(sandbox, rights)) {
        *resp.add_sandboxes() = sandbox;
      }
    }
    return resp;
  });
}

SandboxResponse SnapshotService::SetSandboxState(const SetSandboxStateRequest& req) {
  return ObserveRpc("SnapshotService.SetSandboxState", req.project_id(), req.sandbox_id(), [&] {
    RequireMutable(req.caller(), req.project_id(), req.sandbox_id());

    SandboxResponse resp;
    *resp.mutable_sandbox() = ctx_.snapshots->SetSandboxState(req.project_id(), req.sandbox_id(), req.state());
    *resp.mutable_root()    = ctx_.snapshots->Resolve(req.project_id(), req.sandbox_id(), model::Track::Root());
    return resp;
  });
}

// ------------------------------------------------------------
// Tree navigation
// ------------------------------------------------------------

SnapshotResponse SnapshotService::Resolve(const SnapshotRequest& req) {
  return ObserveRpc("SnapshotService.ResolveSnapshot", req.project_id(), req.sandbox_id(), [&] {
    RequireReadable(req.caller(), req.project_id(), req.sandbox_id());

    SnapshotResponse resp;
    *resp.mutable_snapshot() = ctx_.snapshots->Resolve(req.project_id(), req.sandbox_id(), TrackOf(req));
    return resp;
  });
}

SnapshotListResponse SnapshotService::GetDerived(const SnapshotRequest& req) {
  return ObserveRpc("SnapshotService.GetDerived", req.project_id(), req.sandbox_id(), [&] {
    RequireReadable(req.caller(), req.project_id(), req.sandbox_id());

    SnapshotListResponse resp;
    AddViews(ctx_.snapshots->GetDerived(req.project_id(), req.sandbox_id(), TrackOf(req)), &resp);
    return resp;
  });
}

SnapshotListResponse SnapshotService::GetPath(const SnapshotRequest& req) {
  return ObserveRpc("SnapshotService.GetPath", req.project_id(), req.sandbox_id(), [&] {
    RequireReadable(req.caller(), req.project_id(), req.sandbox_id());

    SnapshotListResponse resp;
    AddViews(ctx_.snapshots->GetPath(req.project_id(), req.sandbox_id(), TrackOf(req)), &resp);
    return resp;
  });
}

// ------------------------------------------------------------
// Tree mutation
// ------------------------------------------------------------

RemoveSnapshotResponse SnapshotService::Remove(const SnapshotRequest& req) {
  return ObserveRpc("SnapshotService.RemoveSnapshot", req.project_id(), req.sandbox_id(), [&] {
    RequireMutable(req.caller(), req.project_id(), req.sandbox_id());

    RemoveSnapshotResponse resp;
    resp.set_removed(!ctx_.snapshots->Remove(req.project_id(), req.sandbox_id(), TrackOf(req)).empty());
    return resp;
  });
}

RemoveSnapshotResponse SnapshotService::ResetRoot(const SandboxRequest& req) {
  return ObserveRpc("SnapshotService.ResetRoot", req.project_id(), req.sandbox_id(), [&] {
    RequireMutable(req.caller(), req.project_id(), req.sandbox_id());

    RemoveSnapshotResponse resp;
    resp.set_removed(!ctx_.snapshots->ResetRoot(req.project_id(), req.sandbox_id()).empty());
    return resp;
  });
}

SnapshotResponse SnapshotService::Lock(const LockSnapshotRequest& req) {
  return ObserveRpc("SnapshotService.LockSnapshot", req.project_id(), req.sandbox_id(), [&] {
    RequireMutable(req.caller(), req.project_id(), req.sandbox_id());

    SnapshotResponse resp;
    *resp.mutable_snapshot() =
        ctx_.snapshots->Lock(req.project_id(), req.sandbox_id(), model::Track::FromProto(req.track()), req.source(), req.comment());
    return resp;
  });
}

SnapshotResponse SnapshotService::Unlock(const SnapshotRequest& req) {
  return ObserveRpc("SnapshotService.UnlockSnapshot", req.project_id(), req.sandbox_id(), [&] {
    RequireMutable(req.caller(), req.project_id(), req.sandbox_id());

    SnapshotResponse resp;
    *resp.mutable_snapshot() = ctx_.snapshots->Unlock(req.project_id(), req.sandbox_id(), TrackOf(req));
    return resp;
  });
}

SnapshotResponse SnapshotService::UpdateConfiguration(const UpdateSnapshotConfigurationRequest& req) {
  return ObserveRpc("SnapshotService.UpdateSnapshotConfiguration", req.project_id(), req.sandbox_id(), [&] {
    RequireMutable(req.caller(), req.project_id(), req.sandbox_id());

    SnapshotResponse resp;
    *resp.mutable_snapshot() = ctx_.snapshots->UpdateConfiguration(req.project_id(), req.sandbox_id(), model::Track::FromProto(req.track()),
                                                                   req.label(), req.description());
    return resp;
  });
}

// ------------------------------------------------------------
// METS
// ------------------------------------------------------------

MetsSynopsisResponse SnapshotService::MetsSynopsis(const SandboxRequest& req) {
  return ObserveRpc("SnapshotService.GetMetsSynopsis", req.project_id(), req.sandbox_id(), [&] {
    RequireReadable(req.caller(), req.project_id(), req.sandbox_id());

    MetsSynopsisResponse resp;
    for (auto& processor : ctx_.snapshots->MetsSynopsis(req.project_id(), req.sandbox_id())) {
      *resp.add_processors() = std::move(processor);
    }
    return resp;
  });
}

FilesForTrackResponse SnapshotService::FilesForTrack(const SnapshotRequest& req) {
  return ObserveRpc("SnapshotService.GetFilesForTrack", req.project_id(), req.sandbox_id(), [&] {
    RequireReadable(req.caller(), req.project_id(), req.sandbox_id());

    FilesForTrackResponse resp;
    *resp.mutable_file_group() = ctx_.snapshots->FilesForTrack(req.project_id(), req.sandbox_id(), TrackOf(req));
    return resp;
  });
}

}
