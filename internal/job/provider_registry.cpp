#include "provider_registry.hpp"

#include "builtin_providers.hpp"
#include "internal/util/errors.hpp"

namespace snapshot::job {

using namespace snapshot::manager::core::v1;
using snapshot::runtime::config::ProviderConfig;

namespace {

constexpr const char* kDefaultImportId = "folio-import";
constexpr const char* kDefaultCopyId   = "parent-copy";

std::shared_ptr<StepProvider> MakeProvider(const ProviderConfig& config, const std::shared_ptr<project::ProjectRegistry>& projects) {
  const auto label = config.label().empty() ? config.id() : config.label();

  switch (config.builtin()) {
    case snapshot::runtime::config::BUILTIN_PROVIDER_FOLIO_IMPORT:
      return std::make_shared<FolioImportProvider>(config.id(), label, projects);
    case snapshot::runtime::config::BUILTIN_PROVIDER_PARENT_COPY:
      return std::make_shared<ParentCopyProvider>(config.id(), label, config.kind() == STEP_KIND_UNSPECIFIED ? STEP_KIND_POSTCORRECTION : config.kind());
    default:
      throw util::BadRequest("provider " + config.id() + " has no builtin implementation");
  }
}

} // namespace

std::shared_ptr<ProviderRegistry> ProviderRegistry::Build(const google::protobuf::RepeatedPtrField<ProviderConfig>& providers,
                                                          std::shared_ptr<project::ProjectRegistry> projects) {
  auto registry = std::make_shared<ProviderRegistry>();

  if (providers.empty()) {
    registry->Register(std::make_shared<FolioImportProvider>(kDefaultImportId, "Folio import", projects));
    registry->Register(std::make_shared<ParentCopyProvider>(kDefaultCopyId, "Parent copy", STEP_KIND_POSTCORRECTION));
    return registry;
  }

  for (const auto& config : providers) {
    registry->Register(MakeProvider(config, projects));
  }
  return registry;
}

void ProviderRegistry::Register(std::shared_ptr<StepProvider> provider) {
  const auto id = provider->Id();
  if (!providers_.emplace(id, std::move(provider)).second) {
    throw util::AlreadyExists("provider " + id);
  }
  order_.push_back(id);
}

std::shared_ptr<StepProvider> ProviderRegistry::Find(const std::string& id) const {
  auto it = providers_.find(id);
  if (it == providers_.end()) {
    throw util::BadRequest("unknown provider " + id);
  }
  return it->second;
}

bool ProviderRegistry::Contains(const std::string& id) const {
  return providers_.count(id) > 0;
}

std::vector<std::shared_ptr<StepProvider>> ProviderRegistry::List() const {
  std::vector<std::shared_ptr<StepProvider>> out;
  out.reserve(order_.size());
  for (const auto& id : order_) {
    out.push_back(providers_.at(id));
  }
  return out;
}

std::shared_ptr<StepProvider> ProviderRegistry::Launcher() const {
  for (const auto& id : order_) {
    const auto& provider = providers_.at(id);
    if (provider->Kind() == STEP_KIND_LAUNCHER) return provider;
  }
  throw util::NotAvailable("no launcher provider is configured");
}

core::SnapshotManager::RootPopulator ProviderRegistry::RootPopulator() const {
  auto launcher = Launcher();
  return [launcher](const ProjectRecord& project, const std::filesystem::path& output_folder) {
    StepContext context;
    context.project       = project;
    context.output_folder = output_folder;
    return launcher->Execute(context);
  };
}

} // namespace snapshot::job
