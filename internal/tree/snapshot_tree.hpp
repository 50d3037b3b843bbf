#pragma once

#include <cstdint>
#include <map>
#include <vector>

#include "internal/model/track.hpp"
#include "snapshot/manager/core/v1/types.pb.h"

namespace snapshot::tree {

struct Node {
  snapshot::manager::core::v1::SnapshotRecord record;
  // Next free child index. Removed children leave holes below it.
  std::uint32_t slot_count = 0;
};

/*
  SnapshotTree

  Arena of nodes keyed by track. Tracks order lexicographically, so a
  subtree is one contiguous key range and the parent of a node is its
  track minus the last index.

  Indices are never renumbered: removing a child leaves a hole, and only
  trailing holes are given back.

  Not thread-safe; the owning sandbox serializes access.
*/
class SnapshotTree {
 public:
  using SnapshotRecord = snapshot::manager::core::v1::SnapshotRecord;
  using SnapshotView   = snapshot::manager::core::v1::SnapshotView;

  explicit SnapshotTree(SnapshotRecord root);

  bool        Contains(const model::Track& track) const;
  const Node& Resolve(const model::Track& track) const;
  Node&       Resolve(const model::Track& track);

  // Live children in index order.
  std::vector<model::Track> Derived(const model::Track& track) const;
  // Root first, `track` last.
  std::vector<model::Track> Path(const model::Track& track) const;
  // `track` followed by its descendants in preorder.
  std::vector<model::Track> Subtree(const model::Track& track) const;

  // Track the next append under `parent` would receive.
  model::Track NextChild(const model::Track& parent) const;

  // Parent must exist and the slot must be free. Loading from disk may
  // insert past holes; appends use NextChild.
  void Insert(const model::Track& track, SnapshotRecord record);

  // Removes `track` and its descendants. The root is never removed;
  // for the root only the descendants go.
  std::vector<model::Track> Remove(const model::Track& track);

  bool AnyLocked(const model::Track& track) const;

  std::size_t  Size() const;
  SnapshotView View(const model::Track& track) const;

 private:
  using NodeMap = std::map<model::Track, Node>;

  // [first, last) of the subtree rooted at `track`.
  std::pair<NodeMap::const_iterator, NodeMap::const_iterator> SubtreeRange(const model::Track& track) const;
  void                                                        TrimSlots(const model::Track& parent);

  NodeMap nodes_;
};

} // namespace snapshot::tree
