#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "snapshot/manager/core/v1/project.pb.h"

namespace snapshot::project {

/*
  Folder-backed project store.

      <projects>/<project>/project.json
      <projects>/<project>/images/<folio>.<format>

  Projects are owned by the workspace; this subsystem only reads them,
  apart from Register which tooling and tests use to seed a workspace.
*/
class ProjectRegistry {
 public:
  using ProjectRecord = snapshot::manager::core::v1::ProjectRecord;
  using Folio         = snapshot::manager::core::v1::Folio;

  explicit ProjectRegistry(std::filesystem::path projects_root);

  ProjectRecord Get(const std::string& project_id) const;
  void          Register(const ProjectRecord& project);

  std::filesystem::path Folder(const std::string& project_id) const;
  std::filesystem::path ImagesFolder(const std::string& project_id) const;
  std::filesystem::path ImagePath(const std::string& project_id, const Folio& folio) const;

  static const Folio* FindFolio(const ProjectRecord& project, const std::string& folio_id);

 private:
  std::filesystem::path root_;
};

} // namespace snapshot::project
