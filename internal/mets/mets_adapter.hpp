#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/mets/mets_document.hpp"
#include "internal/mets/page_naming.hpp"
#include "internal/model/track.hpp"
#include "snapshot/manager/catalog/v1/mets.pb.h"
#include "snapshot/manager/core/v1/project.pb.h"

namespace snapshot::mets {

// One output file of a step, relative to the sandbox snapshots root.
struct OutputFile {
  std::string folio_id;
  std::string path;
  std::string mime_type;
};

// Producer of a file group, recorded as a METS agent.
struct ProcessorInfo {
  std::string name;
  std::string role;
  std::string parameter;
};

/*
  Reconciles the snapshot tree with the sandbox METS document.

  File groups are addressed through the sandbox template (see
  file_group_naming.hpp) and file ids are mapped to folios through the
  physical structure map and the group's page naming convention.
*/
class MetsAdapter {
 public:
  using SandboxRecord = snapshot::manager::core::v1::SandboxRecord;

  // Throws util::PreconditionFailed when the document is missing and
  // util::MalformedDocument when it does not parse.
  static MetsDocument Load(const std::filesystem::path& path);
  static void         Save(const std::filesystem::path& path, const MetsDocument& document);

  // file id -> folio id. Pages that do not follow the convention are skipped.
  static std::unordered_map<std::string, std::string> FolioIndex(const std::vector<Page>& pages, const PageNamingConvention& naming);

  static std::optional<std::string> ResolveFolioForFile(const std::string& file_id, const std::vector<Page>& pages, const PageNamingConvention& naming);

  // Throws util::PreconditionFailed when the track has no file group.
  static snapshot::manager::catalog::v1::MetsFileGroup FilesForTrack(const MetsDocument& document, const SandboxRecord& sandbox, const model::Track& track);

  // Registers the output of `track`, replacing an older group of the same id.
  static std::string AddFileGroup(MetsDocument* document, const SandboxRecord& sandbox, const model::Track& track, const std::vector<OutputFile>& files,
                                  const ProcessorInfo& processor);

  // Drops the file groups of the given tracks; returns the number removed.
  static std::size_t RemoveTracks(MetsDocument* document, const SandboxRecord& sandbox, const std::vector<model::Track>& tracks);

  static std::vector<snapshot::manager::catalog::v1::ProcessorSynopsis> Synopsis(const MetsDocument& document, const SandboxRecord& sandbox);

  static std::string MimeTypeFor(const std::string& file_name);
};

} // namespace snapshot::mets
