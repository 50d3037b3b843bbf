#include "snapshot_archiver.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_set>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "zip_writer.hpp"

namespace snapshot::exporting {

using namespace snapshot::manager::v1;
using observability::StringField;
using observability::UIntField;

namespace {

std::string Lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

// Folio display name with the extension of `file_name`.
std::string NormalizedName(const Folio& folio, const std::string& file_name) {
  const auto stem      = storage::common::SplitExtension(folio.name()).first;
  const auto extension = storage::common::SplitExtension(file_name).second;
  return (stem.empty() ? folio.id() : stem) + extension;
}

struct PendingEntry {
  std::string           name;
  std::filesystem::path path;
};

} // namespace

std::string UniqueNames::Claim(const std::string& name) {
  if (taken_.insert(Lower(name)).second) return name;

  const auto [stem, extension] = storage::common::SplitExtension(name);
  for (std::size_t n = 1;; ++n) {
    auto candidate = stem + "_" + std::to_string(n) + extension;
    if (taken_.insert(Lower(candidate)).second) return candidate;
  }
}

SnapshotArchiver::SnapshotArchiver(std::shared_ptr<core::SnapshotManager> snapshots, std::shared_ptr<project::ProjectRegistry> projects)
    : snapshots_(std::move(snapshots)), projects_(std::move(projects)) {
}

std::string SnapshotArchiver::FilenameMapping(const ProjectRecord& project) {
  std::string tsv;
  for (const auto& folio : project.folios()) {
    tsv += folio.id() + "\t" + folio.name() + "\n";
  }
  return tsv;
}

ZipSummary SnapshotArchiver::Write(const std::string& project_id, const std::string& sandbox_id, const model::Track& track, const ZipOptions& options,
                                   std::shared_ptr<arrow::io::OutputStream> sink) {
  const auto project        = snapshots_->GetProject(project_id);
  const auto sandbox        = snapshots_->GetSandbox(project_id, sandbox_id);
  const auto group          = snapshots_->FilesForTrack(project_id, sandbox_id, track);
  const auto snapshots_root = snapshots_->SnapshotsRoot(project_id, sandbox_id);

  ZipWriter writer(std::move(sink));
  writer.AddBytes(kMappingFileName, FilenameMapping(project));

  UniqueNames                     names;
  names.Claim(kMappingFileName);
  std::vector<PendingEntry>       sources;
  UniqueNames                     source_names;
  std::unordered_set<std::string> sourced_folios;

  std::size_t skipped = 0;
  for (const auto& file : group.files()) {
    const auto path = snapshots_root / file.location_path();
    if (!std::filesystem::is_regular_file(path)) {
      ++skipped;
      continue;
    }

    const auto* folio     = file.folio_id().empty() ? nullptr : project::ProjectRegistry::FindFolio(project, file.folio_id());
    const auto  base_name = path.filename().string();
    const auto  name      = options.normalize_filenames && folio ? NormalizedName(*folio, base_name) : base_name;
    writer.AddFile(names.Claim(name), path);

    if (options.include_source_images && folio && sourced_folios.insert(folio->id()).second) {
      const auto image = projects_->ImagePath(project_id, *folio);
      if (!std::filesystem::is_regular_file(image)) {
        ++skipped;
        continue;
      }
      const auto image_name = options.normalize_filenames ? NormalizedName(*folio, image.filename().string()) : image.filename().string();
      sources.push_back({kSourcePrefix + source_names.Claim(image_name), image});
    }
  }

  for (const auto& entry : sources) {
    writer.AddFile(entry.name, entry.path);
  }
  writer.Finish();

  ZipSummary summary;
  summary.file_name = project.name() + "_" + sandbox.name() + "_snapshot.zip";
  summary.entries   = static_cast<uint32_t>(writer.Entries());

  SNAPSHOT_LOG_INFO("export.zip_written", {StringField("project", project_id), StringField("sandbox", sandbox_id), StringField("track", track.ToString()),
                                           UIntField("entries", summary.entries), UIntField("skipped", skipped)});
  return summary;
}

} // namespace snapshot::exporting
