#pragma once

#include <filesystem>
#include <string>

#include "internal/model/track.hpp"
#include "internal/tree/snapshot_tree.hpp"
#include "snapshot/manager/core/v1/types.pb.h"

namespace snapshot::tree {

/*
  On-disk layout of one sandbox snapshot tree.

      <root>/.snapshot/snapshot.json    root record
      <root>/sandbox/                   root step output
      <root>/derived/<i>/...            child i, same layout, recursively

  The root folder also hosts the METS document, and every METS file
  location is relative to it.
*/
class SnapshotStore {
 public:
  using SnapshotRecord = snapshot::manager::core::v1::SnapshotRecord;

  explicit SnapshotStore(std::filesystem::path root);

  const std::filesystem::path& Root() const {
    return root_;
  }

  std::filesystem::path Folder(const model::Track& track) const;
  std::filesystem::path OutputFolder(const model::Track& track) const;
  std::filesystem::path RecordPath(const model::Track& track) const;
  std::filesystem::path DerivedFolder(const model::Track& track) const;

  // Location of an output file as written into the METS document.
  std::string RelativeOutputPath(const model::Track& track, const std::string& file_name) const;

  SnapshotRecord LoadRecord(const model::Track& track) const;
  void           SaveRecord(const model::Track& track, const SnapshotRecord& record) const;

  // Lays out a snapshot folder (record + empty output) under `folder`.
  // Used for the root and for job staging folders before publication.
  static void Prepare(const std::filesystem::path& folder);
  static void SaveRecordAt(const std::filesystem::path& folder, const SnapshotRecord& record);
  static std::filesystem::path OutputFolderOf(const std::filesystem::path& folder);

  // Rebuilds the tree from the folder layout. Folders that are not a
  // child index or carry no record are skipped.
  SnapshotTree LoadTree() const;

 private:
  void LoadChildren(SnapshotTree* tree, const model::Track& parent) const;

  std::filesystem::path root_;
};

} // namespace snapshot::tree
