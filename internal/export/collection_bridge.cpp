#include "collection_bridge.hpp"

#include <set>
#include <system_error>
#include <unordered_set>

#include "internal/model/step_kind.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace snapshot::exporting {

using namespace snapshot::manager::v1;
using observability::StringField;
using observability::UIntField;

namespace {

// Removes the staging folder on scope exit; failures are only logged.
class StagingFolder {
 public:
  explicit StagingFolder(std::filesystem::path path) : path_(std::move(path)) {
    std::filesystem::create_directories(path_);
  }

  ~StagingFolder() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
      SNAPSHOT_LOG_WARN("collection.staging_cleanup_failed", {StringField("path", path_.string()), StringField("error", ec.message())});
    }
  }

  StagingFolder(const StagingFolder&)            = delete;
  StagingFolder& operator=(const StagingFolder&) = delete;

  const std::filesystem::path& Path() const { return path_; }

 private:
  std::filesystem::path path_;
};

} // namespace

CollectionBridge::CollectionBridge(std::shared_ptr<core::SnapshotManager> snapshots, std::shared_ptr<CollectionStore> store,
                                   std::filesystem::path staging_root)
    : snapshots_(std::move(snapshots)), store_(std::move(store)), staging_root_(std::move(staging_root)) {
}

std::string CollectionBridge::StagedName(const std::string& folio_id, const std::string& source_name) {
  const auto at = source_name.find(folio_id);
  if (at == std::string::npos) {
    return folio_id + "." + source_name;
  }
  const auto suffix = source_name.substr(at + folio_id.size());
  return folio_id + (suffix.rfind('.', 0) == 0 ? suffix : "." + suffix);
}

std::vector<CollectionStore::CollectionSet> CollectionBridge::AddSnapshot(const AddToCollectionRequest& request) {
  storage::common::ValidateFolderName("collection", request.collection_id);

  const auto record = snapshots_->GetRecord(request.project_id, request.sandbox_id, request.track);
  if (!model::CapabilitiesOf(record.kind()).import_capable) {
    throw util::BadRequest("snapshot " + request.track.ToString() + " of kind " + std::string(model::StepKindName(record.kind())) +
                           " cannot be imported into a collection");
  }

  const auto project        = snapshots_->GetProject(request.project_id);
  const auto group          = snapshots_->FilesForTrack(request.project_id, request.sandbox_id, request.track);
  const auto snapshots_root = snapshots_->SnapshotsRoot(request.project_id, request.sandbox_id);

  const std::unordered_set<std::string> selected(request.folio_ids.begin(), request.folio_ids.end());

  StagingFolder staging(staging_root_ / util::ToString(util::GenerateUUID()));

  std::set<std::string> available;
  for (const auto& file : group.files()) {
    const auto& folio_id = file.folio_id();
    if (folio_id.empty()) continue;
    if (!selected.empty() && !selected.count(folio_id)) continue;
    if (!project::ProjectRegistry::FindFolio(project, folio_id)) continue;

    const auto source = snapshots_root / file.location_path();
    if (!std::filesystem::is_regular_file(source)) continue;

    storage::common::CopyFile(source, staging.Path() / StagedName(folio_id, source.filename().string()));
    available.insert(folio_id);
  }

  if (available.empty()) {
    SNAPSHOT_LOG_INFO("collection.nothing_to_add", {StringField("project", request.project_id), StringField("sandbox", request.sandbox_id),
                                                    StringField("track", request.track.ToString())});
    return {};
  }

  const auto now = util::ToProto(util::Now());

  std::vector<CollectionStore::CollectionSet> sets;
  for (const auto& folio : project.folios()) {
    if (!available.count(folio.id())) continue;

    CollectionStore::CollectionSet set;
    set.set_id(folio.id());
    set.set_name(folio.name());
    if (request.include_keywords) {
      set.mutable_keywords()->CopyFrom(folio.keywords());
    }
    set.set_user(request.user);
    *set.mutable_date() = now;
    sets.push_back(std::move(set));
  }

  auto added = store_->Add(request.collection_id, sets, staging.Path(), true);

  SNAPSHOT_LOG_INFO("collection.snapshot_added", {StringField("project", request.project_id), StringField("sandbox", request.sandbox_id),
                                                  StringField("track", request.track.ToString()), StringField("collection", request.collection_id),
                                                  UIntField("sets", added.size())});
  return added;
}

} // namespace snapshot::exporting
