#pragma once

#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/project/project_registry.hpp"
#include "internal/sandbox/sandbox.hpp"

namespace snapshot::sandbox {

/*
  Opens, creates and lists sandboxes of a project.

      <project>/sandboxes/<sandbox>/sandbox.json
      <project>/sandboxes/<sandbox>/snapshots/     snapshot tree root

  Opened sandboxes are cached so every caller shares the same mutex and
  tree. A sandbox is built in a scratch folder and renamed into place,
  so a failed creation leaves nothing behind.
*/
class SandboxRegistry {
 public:
  using SandboxRecord = snapshot::manager::core::v1::SandboxRecord;
  // Fills the snapshots root of a sandbox under construction.
  using Populate = std::function<void(const std::filesystem::path& snapshots_root)>;

  explicit SandboxRegistry(std::shared_ptr<project::ProjectRegistry> projects);

  std::shared_ptr<Sandbox>   Open(const std::string& project_id, const std::string& sandbox_id);
  std::shared_ptr<Sandbox>   Create(const SandboxRecord& record, const Populate& populate);
  std::vector<SandboxRecord> List(const std::string& project_id) const;

  // Persists a new record for an opened sandbox; caller holds its exclusive lock.
  void Save(const Sandbox& sandbox, const SandboxRecord& record) const;

  static std::filesystem::path SnapshotsFolderOf(const std::filesystem::path& sandbox_folder);

 private:
  std::filesystem::path SandboxesFolder(const std::string& project_id) const;
  std::filesystem::path Folder(const std::string& project_id, const std::string& sandbox_id) const;

  std::shared_ptr<project::ProjectRegistry> projects_;

  std::mutex                                                open_mutex_;
  std::unordered_map<std::string, std::shared_ptr<Sandbox>> open_;

  // Serializes creations; held while the root is populated.
  std::mutex create_mutex_;
};

} // namespace snapshot::sandbox
