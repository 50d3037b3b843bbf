#pragma once

#include <memory>
#include <string>

#include "internal/project/project_registry.hpp"
#include "step_provider.hpp"

namespace snapshot::job {

/*
  folio-import

  Copies the project's folio images into the step output. Used as the
  launcher that populates the root snapshot of a new sandbox.
*/
class FolioImportProvider final : public StepProvider {
 public:
  FolioImportProvider(std::string id, std::string label, std::shared_ptr<project::ProjectRegistry> projects);

  const std::string&                    Id() const override { return id_; }
  snapshot::manager::core::v1::StepKind Kind() const override;
  const std::string&                    Label() const override { return label_; }

  model::StepOutput Execute(const StepContext& context) override;

 private:
  std::string                               id_;
  std::string                               label_;
  std::shared_ptr<project::ProjectRegistry> projects_;
};

/*
  parent-copy

  Hands the parent's page files to the next step unchanged, renamed to
  <folio>.<ext>. Correction tools work on such a copy.
*/
class ParentCopyProvider final : public StepProvider {
 public:
  ParentCopyProvider(std::string id, std::string label, snapshot::manager::core::v1::StepKind kind);

  const std::string&                    Id() const override { return id_; }
  snapshot::manager::core::v1::StepKind Kind() const override { return kind_; }
  const std::string&                    Label() const override { return label_; }

  model::StepOutput Execute(const StepContext& context) override;

 private:
  std::string                           id_;
  std::string                           label_;
  snapshot::manager::core::v1::StepKind kind_;
};

} // namespace snapshot::job
