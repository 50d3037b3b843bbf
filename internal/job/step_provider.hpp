#pragma once

#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <string>

#include "cancellation_token.hpp"
#include "internal/model/step_output.hpp"
#include "internal/model/track.hpp"
#include "snapshot/manager/catalog/v1/mets.pb.h"
#include "snapshot/manager/core/v1/project.pb.h"
#include "snapshot/manager/core/v1/types.pb.h"

namespace snapshot::job {

/*
  Everything a workflow step sees while it runs.

  The provider reads the parent's output through parent_files (paths
  relative to snapshots_root) and writes its own output into
  output_folder only. The folder is published as a new snapshot after
  the provider returns.
*/
struct StepContext {
  snapshot::manager::core::v1::ProjectRecord project;

  model::Track                                 parent;
  std::filesystem::path                        snapshots_root;
  std::filesystem::path                        parent_output_folder;
  snapshot::manager::catalog::v1::MetsFileGroup parent_files;

  std::filesystem::path              output_folder;
  std::map<std::string, std::string> arguments;

  std::shared_ptr<CancellationToken> cancellation;
  // Fraction in [0, 1].
  std::function<void(double)> progress;
};

class StepProvider {
 public:
  virtual ~StepProvider() = default;

  virtual const std::string&                Id() const    = 0;
  virtual snapshot::manager::core::v1::StepKind Kind() const  = 0;
  virtual const std::string&                Label() const = 0;

  // Throws Cancelled when the token fires, anything else fails the job.
  virtual model::StepOutput Execute(const StepContext& context) = 0;
};

} // namespace snapshot::job
