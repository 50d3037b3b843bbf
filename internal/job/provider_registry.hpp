#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include "config/config.pb.h"
#include "internal/core/snapshot_manager.hpp"
#include "internal/project/project_registry.hpp"
#include "step_provider.hpp"

namespace snapshot::job {

/*
  Workflow step providers by id.

  Built from the providers section of the runtime config. Without any
  configured provider the registry offers "folio-import" and a
  postcorrection "parent-copy".
*/
class ProviderRegistry {
 public:
  static std::shared_ptr<ProviderRegistry> Build(const google::protobuf::RepeatedPtrField<snapshot::runtime::config::ProviderConfig>& providers,
                                                 std::shared_ptr<project::ProjectRegistry> projects);

  // Throws util::AlreadyExists on a duplicate id.
  void Register(std::shared_ptr<StepProvider> provider);

  // Throws util::BadRequest for an unknown id.
  std::shared_ptr<StepProvider> Find(const std::string& id) const;
  bool                          Contains(const std::string& id) const;

  std::vector<std::shared_ptr<StepProvider>> List() const;

  // First launcher provider; throws util::NotAvailable when none is registered.
  std::shared_ptr<StepProvider> Launcher() const;

  // Runs the launcher synchronously into a new sandbox root.
  core::SnapshotManager::RootPopulator RootPopulator() const;

 private:
  std::map<std::string, std::shared_ptr<StepProvider>> providers_;
  std::vector<std::string>                             order_;
};

} // namespace snapshot::job
