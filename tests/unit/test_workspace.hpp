#pragma once

#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/core/snapshot_manager.hpp"
#include "internal/job/provider_registry.hpp"
#include "internal/project/project_registry.hpp"
#include "internal/sandbox/sandbox_registry.hpp"
#include "internal/tree/snapshot_store.hpp"
#include "snapshot/manager/v1.hpp"

namespace snapshot::testing {

/*
  Throwaway workspace for tests that need a project on disk:

      <tmp>/snapshot_manager_tests/<name>/projects/p1/...

  Folios "0001".."000N" are named "scan-1".."scan-N" and get a small
  png next to the project unless asked otherwise.
*/
struct Workspace {
  std::filesystem::path                     root;
  std::shared_ptr<project::ProjectRegistry> projects;
  std::shared_ptr<sandbox::SandboxRegistry> sandboxes;
  std::shared_ptr<core::SnapshotManager>    snapshots;
  std::shared_ptr<job::ProviderRegistry>    providers;
};

inline std::filesystem::path FreshDirectory(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "snapshot_manager_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

inline void WriteFile(const std::filesystem::path& path, const std::string& content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary);
  out << content;
}

inline std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline std::string FolioId(int n) {
  std::string id = std::to_string(n);
  return std::string(4 - id.size(), '0') + id;
}

inline snapshot::manager::v1::ProjectRecord SeedProject(project::ProjectRegistry& projects, const std::string& project_id, int folios,
                                                        bool with_images = true) {
  snapshot::manager::v1::ProjectRecord project;
  project.set_id(project_id);
  project.set_name("Project " + project_id);
  project.set_state(snapshot::manager::v1::PROJECT_STATE_ACTIVE);
  for (int i = 1; i <= folios; ++i) {
    auto* folio = project.add_folios();
    folio->set_id(FolioId(i));
    folio->set_name("scan-" + std::to_string(i));
    folio->set_format("png");
    folio->add_keywords("page");
  }
  projects.Register(project);

  if (with_images) {
    for (const auto& folio : project.folios()) {
      WriteFile(projects.ImagePath(project_id, folio), "png:" + folio.id());
    }
  }
  return project;
}

inline snapshot::runtime::config::SandboxDefaultsConfig SandboxDefaults() {
  snapshot::runtime::config::SandboxDefaultsConfig defaults;
  defaults.set_mets_file_name("mets.xml");
  defaults.set_mets_group("ocr4all");
  defaults.set_file_group_template("{group}-{track}");
  return defaults;
}

inline Workspace MakeWorkspace(const std::string& name) {
  Workspace ws;
  ws.root      = FreshDirectory(name);
  ws.projects  = std::make_shared<project::ProjectRegistry>(ws.root / "projects");
  ws.sandboxes = std::make_shared<sandbox::SandboxRegistry>(ws.projects);
  ws.snapshots = std::make_shared<core::SnapshotManager>(ws.projects, ws.sandboxes, SandboxDefaults());
  const google::protobuf::RepeatedPtrField<snapshot::runtime::config::ProviderConfig> builtin_only;
  ws.providers = job::ProviderRegistry::Build(builtin_only, ws.projects);
  return ws;
}

inline snapshot::manager::v1::SandboxRecord CreateSandbox(Workspace& ws, const std::string& project_id, const std::string& sandbox_id) {
  core::CreateSandboxParams params;
  params.project_id       = project_id;
  params.sandbox_id       = sandbox_id;
  params.user             = "tester";
  params.root_provider_id = ws.providers->Launcher()->Id();
  params.root_label       = ws.providers->Launcher()->Label();
  return ws.snapshots->CreateSandbox(params, ws.providers->RootPopulator());
}

// Publishes a child of `parent` holding one text file per folio, the way
// a finished job does.
inline model::Track AppendChild(Workspace& ws, const std::string& project_id, const std::string& sandbox_id, const model::Track& parent,
                                const std::string& label, snapshot::manager::v1::StepKind kind = snapshot::manager::v1::STEP_KIND_POSTCORRECTION) {
  const auto project = ws.snapshots->GetProject(project_id);
  const auto staging = ws.snapshots->CreateStagingFolder(project_id, sandbox_id);

  core::AppendRequest request;
  request.project_id     = project_id;
  request.sandbox_id     = sandbox_id;
  request.parent         = parent;
  request.staging_folder = staging;
  request.record.set_kind(kind);
  request.record.set_label(label);
  request.record.set_provider_id("test");
  request.processor = {"test", "postcorrection", ""};

  for (const auto& folio : project.folios()) {
    const auto file_name = folio.id() + ".gt.txt";
    WriteFile(tree::SnapshotStore::OutputFolderOf(staging) / file_name, label + ":" + folio.id());
    request.output.files.push_back({folio.id(), file_name, "text/plain"});
  }
  return ws.snapshots->Append(request);
}

} // namespace snapshot::testing
