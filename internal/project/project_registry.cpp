#include "project_registry.hpp"

#include "internal/storage/common/path_utils.hpp"
#include "internal/storage/common/proto_json.hpp"
#include "internal/util/errors.hpp"

namespace snapshot::project {

namespace {

constexpr const char* kProjectFile  = "project.json";
constexpr const char* kImagesFolder  = "images";

} // namespace

ProjectRegistry::ProjectRegistry(std::filesystem::path projects_root) : root_(std::move(projects_root)) {
}

ProjectRegistry::ProjectRecord ProjectRegistry::Get(const std::string& project_id) const {
  const auto path = Folder(project_id) / kProjectFile;
  if (!std::filesystem::is_regular_file(path)) {
    throw util::NotFound("project not found: " + project_id);
  }

  ProjectRecord project;
  storage::common::LoadProtoJson(path, &project);
  if (project.id() != project_id) {
    throw std::runtime_error("project " + project_id + " is stored with id " + project.id());
  }
  return project;
}

void ProjectRegistry::Register(const ProjectRecord& project) {
  for (const auto& folio : project.folios()) {
    storage::common::ValidateFolderName("folio", folio.id());
  }
  std::filesystem::create_directories(ImagesFolder(project.id()));
  storage::common::SaveProtoJson(Folder(project.id()) / kProjectFile, project);
}

std::filesystem::path ProjectRegistry::Folder(const std::string& project_id) const {
  return storage::common::ChildFolder(root_, "project", project_id);
}

std::filesystem::path ProjectRegistry::ImagesFolder(const std::string& project_id) const {
  return Folder(project_id) / kImagesFolder;
}

std::filesystem::path ProjectRegistry::ImagePath(const std::string& project_id, const Folio& folio) const {
  return ImagesFolder(project_id) / (folio.id() + "." + folio.format());
}

const ProjectRegistry::Folio* ProjectRegistry::FindFolio(const ProjectRecord& project, const std::string& folio_id) {
  for (const auto& folio : project.folios()) {
    if (folio.id() == folio_id) return &folio;
  }
  return nullptr;
}

} // namespace snapshot::project
