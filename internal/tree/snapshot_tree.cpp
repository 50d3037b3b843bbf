#include "snapshot_tree.hpp"

#include <algorithm>

#include "internal/util/errors.hpp"

namespace snapshot::tree {

SnapshotTree::SnapshotTree(SnapshotRecord root) {
  nodes_.emplace(model::Track::Root(), Node{std::move(root), 0});
}

bool SnapshotTree::Contains(const model::Track& track) const {
  return nodes_.count(track) > 0;
}

const Node& SnapshotTree::Resolve(const model::Track& track) const {
  auto it = nodes_.find(track);
  if (it == nodes_.end()) {
    throw util::TrackNotFound("track not found: " + track.ToString());
  }
  return it->second;
}

Node& SnapshotTree::Resolve(const model::Track& track) {
  auto it = nodes_.find(track);
  if (it == nodes_.end()) {
    throw util::TrackNotFound("track not found: " + track.ToString());
  }
  return it->second;
}

std::pair<SnapshotTree::NodeMap::const_iterator, SnapshotTree::NodeMap::const_iterator> SnapshotTree::SubtreeRange(const model::Track& track) const {
  auto first = nodes_.find(track);
  if (first == nodes_.end()) {
    throw util::TrackNotFound("track not found: " + track.ToString());
  }
  auto last = std::next(first);
  while (last != nodes_.end() && track.IsPrefixOf(last->first)) {
    ++last;
  }
  return {first, last};
}

std::vector<model::Track> SnapshotTree::Derived(const model::Track& track) const {
  auto [first, last] = SubtreeRange(track);

  std::vector<model::Track> children;
  for (auto it = std::next(first); it != last; ++it) {
    if (it->first.Depth() == track.Depth() + 1) {
      children.push_back(it->first);
    }
  }
  return children;
}

std::vector<model::Track> SnapshotTree::Path(const model::Track& track) const {
  if (!Contains(track)) {
    throw util::TrackNotFound("track not found: " + track.ToString());
  }

  std::vector<model::Track> path;
  for (auto current = track;; current = current.Parent()) {
    path.push_back(current);
    if (current.IsRoot()) break;
  }
  std::reverse(path.begin(), path.end());
  return path;
}

std::vector<model::Track> SnapshotTree::Subtree(const model::Track& track) const {
  auto [first, last] = SubtreeRange(track);

  std::vector<model::Track> tracks;
  for (auto it = first; it != last; ++it) {
    tracks.push_back(it->first);
  }
  return tracks;
}

model::Track SnapshotTree::NextChild(const model::Track& parent) const {
  return parent.Child(Resolve(parent).slot_count);
}

void SnapshotTree::Insert(const model::Track& track, SnapshotRecord record) {
  if (track.IsRoot()) {
    throw util::AlreadyExists("root snapshot already exists");
  }
  auto& parent = Resolve(track.Parent());
  if (Contains(track)) {
    throw util::AlreadyExists("snapshot already exists: " + track.ToString());
  }

  nodes_.emplace(track, Node{std::move(record), 0});
  parent.slot_count = std::max(parent.slot_count, track.Last() + 1);
}

std::vector<model::Track> SnapshotTree::Remove(const model::Track& track) {
  auto removed = Subtree(track);
  if (track.IsRoot()) {
    removed.erase(removed.begin());
  }

  for (const auto& descendant : removed) {
    nodes_.erase(descendant);
  }

  if (track.IsRoot()) {
    nodes_.at(track).slot_count = 0;
  } else {
    TrimSlots(track.Parent());
  }
  return removed;
}

bool SnapshotTree::AnyLocked(const model::Track& track) const {
  auto [first, last] = SubtreeRange(track);
  return std::any_of(first, last, [](const auto& entry) { return entry.second.record.has_lock(); });
}

std::size_t SnapshotTree::Size() const {
  return nodes_.size();
}

SnapshotTree::SnapshotView SnapshotTree::View(const model::Track& track) const {
  const auto& node = Resolve(track);

  SnapshotView view;
  *view.mutable_track() = track.ToProto();
  view.set_label(node.record.label());
  view.set_description(node.record.description());
  if (node.record.has_lock()) {
    *view.mutable_lock() = node.record.lock();
  }
  view.set_child_count(static_cast<uint32_t>(Derived(track).size()));
  view.set_kind(node.record.kind());
  view.set_provider_id(node.record.provider_id());
  view.set_job_id(node.record.job_id());
  *view.mutable_created() = node.record.created();
  *view.mutable_updated() = node.record.updated();
  view.set_user(node.record.user());
  return view;
}

void SnapshotTree::TrimSlots(const model::Track& parent) {
  auto& node = Resolve(parent);
  while (node.slot_count > 0 && !Contains(parent.Child(node.slot_count - 1))) {
    --node.slot_count;
  }
}

} // namespace snapshot::tree
