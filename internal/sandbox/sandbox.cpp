#include "sandbox.hpp"

#include "internal/sandbox/sandbox_registry.hpp"

namespace snapshot::sandbox {

Sandbox::Sandbox(SandboxRecord record, std::filesystem::path folder, tree::SnapshotTree tree)
    : record_(std::move(record)), folder_(std::move(folder)), store_(SandboxRegistry::SnapshotsFolderOf(folder_)), tree_(std::move(tree)) {
}

std::filesystem::path Sandbox::MetsPath() const {
  return store_.Root() / record_.mets_file_name();
}

std::filesystem::path Sandbox::StagingRoot() const {
  return folder_ / ".staging";
}

} // namespace snapshot::sandbox
