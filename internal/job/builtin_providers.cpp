#include "builtin_providers.hpp"

#include <filesystem>

#include "internal/mets/mets_adapter.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/storage/common/path_utils.hpp"

namespace snapshot::job {

using namespace snapshot::manager::core::v1;
using observability::StringField;

namespace {

void ReportProgress(const StepContext& context, std::size_t done, std::size_t total) {
  if (context.progress && total > 0) {
    context.progress(static_cast<double>(done) / static_cast<double>(total));
  }
}

void CheckCancelled(const StepContext& context) {
  if (context.cancellation) context.cancellation->ThrowIfCancelled();
}

} // namespace

// ------------------------------------------------------------
// folio-import
// ------------------------------------------------------------

FolioImportProvider::FolioImportProvider(std::string id, std::string label, std::shared_ptr<project::ProjectRegistry> projects)
    : id_(std::move(id)), label_(std::move(label)), projects_(std::move(projects)) {
}

StepKind FolioImportProvider::Kind() const {
  return STEP_KIND_LAUNCHER;
}

model::StepOutput FolioImportProvider::Execute(const StepContext& context) {
  model::StepOutput output;

  const auto& folios = context.project.folios();
  std::size_t done   = 0;
  for (const auto& folio : folios) {
    CheckCancelled(context);

    const auto source = projects_->ImagePath(context.project.id(), folio);
    if (!std::filesystem::exists(source)) {
      SNAPSHOT_LOG_WARN("provider.folio_missing", {StringField("provider", id_), StringField("project", context.project.id()),
                                                   StringField("folio", folio.id())});
      ReportProgress(context, ++done, folios.size());
      continue;
    }

    const auto file_name = source.filename().string();
    storage::common::CopyFile(source, context.output_folder / file_name);
    output.files.push_back({folio.id(), file_name, mets::MetsAdapter::MimeTypeFor(file_name)});

    ReportProgress(context, ++done, folios.size());
  }

  return output;
}

// ------------------------------------------------------------
// parent-copy
// ------------------------------------------------------------

ParentCopyProvider::ParentCopyProvider(std::string id, std::string label, StepKind kind)
    : id_(std::move(id)), label_(std::move(label)), kind_(kind) {
}

model::StepOutput ParentCopyProvider::Execute(const StepContext& context) {
  model::StepOutput output;

  const auto& files = context.parent_files.files();
  std::size_t done  = 0;
  for (const auto& file : files) {
    CheckCancelled(context);
    ReportProgress(context, done++, files.size());

    if (file.folio_id().empty()) continue;

    const auto source = context.snapshots_root / file.location_path();
    if (!std::filesystem::exists(source)) {
      SNAPSHOT_LOG_WARN("provider.parent_file_missing", {StringField("provider", id_), StringField("path", source.string())});
      continue;
    }

    const auto [stem, extension] = storage::common::SplitExtension(source.filename().string());
    const auto file_name         = file.folio_id() + extension;
    storage::common::CopyFile(source, context.output_folder / file_name);
    output.files.push_back({file.folio_id(), file_name, file.mime_type().empty() ? mets::MetsAdapter::MimeTypeFor(file_name) : file.mime_type()});
  }

  ReportProgress(context, files.size(), files.size());
  return output;
}

} // namespace snapshot::job
