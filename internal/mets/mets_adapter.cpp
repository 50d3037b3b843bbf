#include "mets_adapter.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

#include "internal/mets/file_group_naming.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace snapshot::mets {

using snapshot::manager::catalog::v1::MetsFile;
using snapshot::manager::catalog::v1::MetsFileGroup;
using snapshot::manager::catalog::v1::ProcessorSynopsis;

namespace {

void FillFile(const FileEntry& entry, const std::unordered_map<std::string, std::string>& folios, MetsFile* file) {
  file->set_id(entry.id);
  file->set_location_path(entry.href);
  file->set_mime_type(entry.mime_type);
  if (auto it = folios.find(entry.id); it != folios.end()) {
    file->set_folio_id(it->second);
  }
}

} // namespace

MetsDocument MetsAdapter::Load(const std::filesystem::path& path) {
  if (!std::filesystem::is_regular_file(path)) {
    throw util::PreconditionFailed("METS document not found: " + path.string());
  }

  try {
    return MetsDocument::Parse(storage::common::ReadFileToString(path));
  } catch (const util::MalformedDocument& e) {
    SNAPSHOT_LOG_ERROR("mets.parse_failed", {observability::StringField("path", path.string()), observability::StringField("error", e.what())});
    throw;
  }
}

void MetsAdapter::Save(const std::filesystem::path& path, const MetsDocument& document) {
  storage::common::WriteFileAtomic(path, document.Serialize(), true);
}

std::unordered_map<std::string, std::string> MetsAdapter::FolioIndex(const std::vector<Page>& pages, const PageNamingConvention& naming) {
  std::unordered_map<std::string, std::string> index;
  for (const auto& page : pages) {
    auto folio = naming.FolioForPage(page.id);
    if (!folio) {
      SNAPSHOT_LOG_WARN("mets.page_skipped", {observability::StringField("page", page.id)});
      continue;
    }
    for (const auto& file_id : page.file_ids) {
      index.emplace(file_id, *folio);
    }
  }
  return index;
}

std::optional<std::string> MetsAdapter::ResolveFolioForFile(const std::string& file_id, const std::vector<Page>& pages, const PageNamingConvention& naming) {
  for (const auto& page : pages) {
    if (std::find(page.file_ids.begin(), page.file_ids.end(), file_id) == page.file_ids.end()) {
      continue;
    }
    if (auto folio = naming.FolioForPage(page.id)) {
      return folio;
    }
  }
  return std::nullopt;
}

MetsFileGroup MetsAdapter::FilesForTrack(const MetsDocument& document, const SandboxRecord& sandbox, const model::Track& track) {
  const auto group_id = FileGroupIdFor(sandbox.file_group_template(), sandbox.mets_group(), track);
  auto       group    = document.FindFileGroup(group_id);
  if (!group) {
    throw util::PreconditionFailed("no METS file group " + group_id + " for track " + track.ToString());
  }

  const auto folios = FolioIndex(document.Pages(), *PageNamingFor(sandbox.mets_group()));

  MetsFileGroup result;
  result.set_id(group->id);
  for (const auto& entry : group->files) {
    FillFile(entry, folios, result.add_files());
  }
  return result;
}

std::string MetsAdapter::AddFileGroup(MetsDocument* document, const SandboxRecord& sandbox, const model::Track& track, const std::vector<OutputFile>& files,
                                      const ProcessorInfo& processor) {
  const auto  group_id = FileGroupIdFor(sandbox.file_group_template(), sandbox.mets_group(), track);
  const auto  naming   = PageNamingFor(sandbox.mets_group());

  // a reused index must not inherit the producer of a removed snapshot
  document->RemoveFileGroup(group_id);

  // ids are unique document wide; later files of a folio get a counter
  std::unordered_map<std::string, std::size_t> per_folio;
  FileGroup                                    group;
  group.id = group_id;
  for (const auto& output : files) {
    const auto n = ++per_folio[output.folio_id];

    FileEntry entry;
    entry.id        = group_id + "_" + output.folio_id + (n > 1 ? "_" + std::to_string(n) : "");
    entry.href      = output.path;
    entry.mime_type = output.mime_type.empty() ? MimeTypeFor(output.path) : output.mime_type;
    group.files.push_back(std::move(entry));
  }
  document->PutFileGroup(group);

  for (std::size_t i = 0; i < files.size(); ++i) {
    document->AddPagePointer(naming->PageForFolio(files[i].folio_id), group.files[i].id);
  }

  Agent agent;
  agent.role       = "OTHER";
  agent.other_role = processor.role;
  agent.name       = processor.name;
  agent.notes.emplace_back(kNoteOutputFileGroup, group_id);
  if (!processor.parameter.empty()) {
    agent.notes.emplace_back(kNoteParameter, processor.parameter);
  }
  document->AddAgent(agent);
  return group_id;
}

std::size_t MetsAdapter::RemoveTracks(MetsDocument* document, const SandboxRecord& sandbox, const std::vector<model::Track>& tracks) {
  std::size_t removed = 0;
  for (const auto& track : tracks) {
    if (document->RemoveFileGroup(FileGroupIdFor(sandbox.file_group_template(), sandbox.mets_group(), track))) {
      ++removed;
    }
  }
  return removed;
}

std::vector<ProcessorSynopsis> MetsAdapter::Synopsis(const MetsDocument& document, const SandboxRecord& sandbox) {
  std::unordered_map<std::string, FileGroup> groups;
  for (auto& group : document.FileGroups()) {
    groups.emplace(group.id, std::move(group));
  }
  const auto folios = FolioIndex(document.Pages(), *PageNamingFor(sandbox.mets_group()));

  std::vector<ProcessorSynopsis> processors;
  for (const auto& agent : document.Agents()) {
    auto output = agent.Note(kNoteOutputFileGroup);
    if (!output) {
      continue;
    }

    ProcessorSynopsis synopsis;
    synopsis.set_name(agent.name);
    synopsis.set_file_group(*output);
    if (auto parameter = agent.Note(kNoteParameter)) {
      synopsis.set_parameter(*parameter);
    }
    if (auto track = TrackForFileGroup(sandbox.file_group_template(), sandbox.mets_group(), *output)) {
      *synopsis.mutable_track() = track->ToProto();
    }
    if (auto it = groups.find(*output); it != groups.end()) {
      for (const auto& entry : it->second.files) {
        FillFile(entry, folios, synopsis.add_files());
      }
    }
    processors.push_back(std::move(synopsis));
  }
  return processors;
}

std::string MetsAdapter::MimeTypeFor(const std::string& file_name) {
  auto extension = storage::common::SplitExtension(std::filesystem::path(file_name).filename().string()).second;
  std::transform(extension.begin(), extension.end(), extension.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  if (extension == ".png") return "image/png";
  if (extension == ".tif" || extension == ".tiff") return "image/tiff";
  if (extension == ".jpg" || extension == ".jpeg") return "image/jpeg";
  if (extension == ".xml") return "application/vnd.prima.page+xml";
  if (extension == ".txt") return "text/plain";
  return "application/octet-stream";
}

} // namespace snapshot::mets
