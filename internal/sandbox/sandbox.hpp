#pragma once

#include <filesystem>
#include <shared_mutex>

#include "internal/tree/snapshot_store.hpp"
#include "internal/tree/snapshot_tree.hpp"
#include "snapshot/manager/core/v1/project.pb.h"

namespace snapshot::sandbox {

/*
  One opened sandbox: its configuration record and snapshot tree.

  Mutex() is the single mutual-exclusion boundary for the sandbox.
  Readers take it shared, every tree/record/METS mutation exclusive.
  Nothing in here locks on its own.
*/
class Sandbox {
 public:
  using SandboxRecord = snapshot::manager::core::v1::SandboxRecord;

  Sandbox(SandboxRecord record, std::filesystem::path folder, tree::SnapshotTree tree);

  std::shared_mutex& Mutex() const {
    return mutex_;
  }

  const SandboxRecord& Record() const {
    return record_;
  }

  void SetRecord(SandboxRecord record) {
    record_ = std::move(record);
  }

  tree::SnapshotTree& Tree() {
    return tree_;
  }

  const tree::SnapshotTree& Tree() const {
    return tree_;
  }

  const tree::SnapshotStore& Store() const {
    return store_;
  }

  const std::filesystem::path& Folder() const {
    return folder_;
  }

  std::filesystem::path MetsPath() const;
  // Job output is staged here, on the same file system as the tree.
  std::filesystem::path StagingRoot() const;

 private:
  mutable std::shared_mutex mutex_;
  SandboxRecord             record_;
  std::filesystem::path     folder_;
  tree::SnapshotStore       store_;
  tree::SnapshotTree        tree_;
};

} // namespace snapshot::sandbox
