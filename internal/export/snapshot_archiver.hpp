#pragma once

#include <arrow/io/interfaces.h>

#include <memory>
#include <set>
#include <string>

#include "internal/core/snapshot_manager.hpp"
#include "internal/project/project_registry.hpp"

namespace snapshot::exporting {

struct ZipOptions {
  bool normalize_filenames   = false;
  bool include_source_images = false;
};

struct ZipSummary {
  std::string file_name;
  uint32_t    entries = 0;
};

// Hands out names unique within one archive folder, ignoring case:
// "a.png", "A.png" -> "a.png", "A_1.png".
class UniqueNames {
 public:
  std::string Claim(const std::string& name);

 private:
  std::set<std::string> taken_;
};

/*
  SnapshotArchiver

  Zips the output of one snapshot:

      filename-mapping.tsv      <folio id>\t<folio name>, project order
      <entries>                 snapshot output files
      source/<entries>          folio images, when requested
*/
class SnapshotArchiver {
 public:
  static constexpr const char* kMappingFileName = "filename-mapping.tsv";
  static constexpr const char* kSourcePrefix    = "source/";

  SnapshotArchiver(std::shared_ptr<core::SnapshotManager> snapshots, std::shared_ptr<project::ProjectRegistry> projects);

  ZipSummary Write(const std::string& project_id, const std::string& sandbox_id, const model::Track& track, const ZipOptions& options,
                   std::shared_ptr<arrow::io::OutputStream> sink);

  static std::string FilenameMapping(const snapshot::manager::core::v1::ProjectRecord& project);

 private:
  std::shared_ptr<core::SnapshotManager>    snapshots_;
  std::shared_ptr<project::ProjectRegistry> projects_;
};

} // namespace snapshot::exporting
