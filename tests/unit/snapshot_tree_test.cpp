#include <cassert>
#include <filesystem>
#include <iostream>
#include <vector>

#include "internal/tree/snapshot_store.hpp"
#include "internal/tree/snapshot_tree.hpp"
#include "internal/util/errors.hpp"
#include "test_workspace.hpp"

namespace {

using snapshot::manager::core::v1::SnapshotRecord;
using snapshot::model::Track;
using snapshot::tree::SnapshotStore;
using snapshot::tree::SnapshotTree;

SnapshotRecord Labeled(const std::string& label) {
  SnapshotRecord record;
  record.set_label(label);
  return record;
}

template <typename Fn>
bool ThrowsTrackNotFound(Fn&& fn) {
  try {
    fn();
  } catch (const snapshot::util::TrackNotFound&) {
    return true;
  }
  return false;
}

void TestAppendAssignsNextIndex() {
  SnapshotTree tree(Labeled("root"));
  assert(tree.NextChild(Track::Root()) == Track{0});
  tree.Insert(tree.NextChild(Track::Root()), Labeled("a"));
  tree.Insert(tree.NextChild(Track::Root()), Labeled("b"));
  assert(tree.NextChild(Track::Root()) == Track{2});
  assert(tree.NextChild(Track{1}) == (Track{1, 0}));

  const auto derived = tree.Derived(Track::Root());
  assert(derived.size() == 2);
  assert(derived[0] == Track{0});
  assert(derived[1] == Track{1});
  assert(tree.Resolve(Track{1}).record.label() == "b");
}

void TestResolveUnknownTrackFails() {
  SnapshotTree tree(Labeled("root"));
  assert(ThrowsTrackNotFound([&] { tree.Resolve(Track{0}); }));
  assert(ThrowsTrackNotFound([&] { tree.Derived(Track{3, 1}); }));
  assert(ThrowsTrackNotFound([&] { tree.Path(Track{0}); }));
  assert(ThrowsTrackNotFound([&] { tree.Insert(Track{0, 0}, Labeled("orphan")); }));
}

void TestPathRunsFromRoot() {
  SnapshotTree tree(Labeled("root"));
  tree.Insert(Track{0}, Labeled("a"));
  tree.Insert(Track{0, 0}, Labeled("a0"));

  const auto path = tree.Path(Track{0, 0});
  assert(path.size() == 3);
  assert(path[0].IsRoot());
  assert(path[1] == Track{0});
  assert(path[2] == (Track{0, 0}));
}

void TestRemoveTakesSubtreeAndKeepsSiblingIndices() {
  SnapshotTree tree(Labeled("root"));
  tree.Insert(Track{0}, Labeled("a"));
  tree.Insert(Track{1}, Labeled("b"));
  tree.Insert(Track{2}, Labeled("c"));
  tree.Insert(Track{1, 0}, Labeled("b0"));

  const auto removed = tree.Remove(Track{1});
  assert(removed.size() == 2);
  assert(!tree.Contains(Track{1}));
  assert(!tree.Contains(Track{1, 0}));

  // siblings are not renumbered
  assert(tree.Resolve(Track{2}).record.label() == "c");
  assert(tree.NextChild(Track::Root()) == Track{3});

  // a trailing hole is given back
  tree.Remove(Track{2});
  assert(tree.NextChild(Track::Root()) == Track{1});
}

void TestRemoveRootKeepsRoot() {
  SnapshotTree tree(Labeled("root"));
  tree.Insert(Track{0}, Labeled("a"));
  tree.Insert(Track{0, 0}, Labeled("a0"));

  const auto removed = tree.Remove(Track::Root());
  assert(removed.size() == 2);
  assert(tree.Size() == 1);
  assert(tree.Derived(Track::Root()).empty());
  assert(tree.NextChild(Track::Root()) == Track{0});
}

void TestAnyLockedLooksAtDescendants() {
  SnapshotTree tree(Labeled("root"));
  tree.Insert(Track{0}, Labeled("a"));
  tree.Insert(Track{0, 0}, Labeled("a0"));
  tree.Resolve(Track{0, 0}).record.mutable_lock()->set_source("job-7");

  assert(tree.AnyLocked(Track{0}));
  assert(tree.AnyLocked(Track::Root()));

  tree.Insert(Track{1}, Labeled("b"));
  assert(!tree.AnyLocked(Track{1}));
}

void TestViewCountsLiveChildren() {
  SnapshotTree tree(Labeled("root"));
  tree.Insert(Track{0}, Labeled("a"));
  tree.Insert(Track{1}, Labeled("b"));
  tree.Remove(Track{0});

  const auto view = tree.View(Track::Root());
  assert(view.child_count() == 1);
  assert(view.label() == "root");
  assert(view.track().indices_size() == 0);
  assert(!view.has_lock());
}

void TestStoreLoadsTreeFromFolders() {
  const auto    root = snapshot::testing::FreshDirectory("snapshot_tree_store");
  SnapshotStore store(root);

  SnapshotStore::Prepare(root);
  SnapshotStore::SaveRecordAt(root, Labeled("root"));
  for (const auto& track : std::vector<Track>{Track{0}, Track{2}, Track{2, 0}}) {
    SnapshotStore::Prepare(store.Folder(track));
    store.SaveRecord(track, Labeled("n" + track.ToString()));
  }
  // neither an index nor a snapshot; both are skipped
  std::filesystem::create_directories(store.DerivedFolder(Track::Root()) / "tmp");
  std::filesystem::create_directories(store.DerivedFolder(Track::Root()) / "5");

  auto tree = store.LoadTree();
  assert(tree.Size() == 4);
  assert(tree.Resolve(Track{2, 0}).record.label() == "n[2,0]");
  assert(!tree.Contains(Track{1}));
  assert(!tree.Contains(Track{5}));
  assert(tree.NextChild(Track::Root()) == Track{3});

  assert(store.RelativeOutputPath(Track{2, 0}, "0001.xml") == "derived/2/derived/0/sandbox/0001.xml");
  assert(store.RelativeOutputPath(Track::Root(), "0001.png") == "sandbox/0001.png");
}

} // namespace

int main() {
  TestAppendAssignsNextIndex();
  TestResolveUnknownTrackFails();
  TestPathRunsFromRoot();
  TestRemoveTakesSubtreeAndKeepsSiblingIndices();
  TestRemoveRootKeepsRoot();
  TestAnyLockedLooksAtDescendants();
  TestViewCountsLiveChildren();
  TestStoreLoadsTreeFromFolders();

  std::cout << "snapshot_manager_unit_snapshot_tree: pass\n";
  return 0;
}
