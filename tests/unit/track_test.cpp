#include "internal/model/track.hpp"

#include <cassert>
#include <iostream>
#include <map>
#include <stdexcept>

#include "internal/util/errors.hpp"

namespace {

using snapshot::model::Track;

void TestRootTrack() {
  const auto root = Track::Root();
  assert(root.IsRoot());
  assert(root.Depth() == 0);
  assert(root.ToString() == "[]");
  assert(Track::Parse("[]") == root);
}

void TestParentAndChild() {
  const Track track{0, 2};
  assert(track.Parent() == Track{0});
  assert(track.Parent().Parent() == Track::Root());
  assert(track.Last() == 2);
  assert(Track{0}.Child(2) == track);
}

void TestPrefixRelations() {
  assert(Track{}.IsStrictPrefixOf(Track{0}));
  assert(Track{0}.IsStrictPrefixOf(Track{0, 1}));
  assert(!Track{0}.IsStrictPrefixOf(Track{0}));
  assert(Track{0}.IsPrefixOf(Track{0}));
  assert(!Track{1}.IsPrefixOf(Track{0, 1}));
}

void TestParseRoundTripsText() {
  assert(Track::Parse("[0,2,11]") == (Track{0, 2, 11}));
  assert((Track{3, 4}).ToString() == "[3,4]");
}

void TestParseRejectsMalformedText() {
  for (const char* text : {"", "0,1", "[0,]", "[,0]", "[a]", "[0;1]", "[-1]"}) {
    bool threw = false;
    try {
      Track::Parse(text);
    } catch (const snapshot::util::BadRequest&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestRootHasNoParent() {
  bool threw = false;
  try {
    Track::Root().Parent();
  } catch (const snapshot::util::BadRequest&) {
    threw = true;
  }
  assert(threw);
}

void TestSubtreeIsContiguousInOrder() {
  std::map<Track, int> ordered{{Track{1}, 0}, {Track{0, 1}, 0}, {Track{}, 0}, {Track{0}, 0}, {Track{0, 0, 5}, 0}};

  std::vector<Track> keys;
  for (const auto& [track, unused] : ordered) {
    keys.push_back(track);
  }
  assert(keys.size() == 5);
  assert(keys[0] == Track{});
  assert(keys[1] == Track{0});
  assert(keys[2] == (Track{0, 0, 5}));
  assert(keys[3] == (Track{0, 1}));
  assert(keys[4] == Track{1});
}

void TestProtoConversion() {
  const Track track{2, 0, 7};
  const auto  proto = track.ToProto();
  assert(proto.indices_size() == 3);
  assert(proto.indices(2) == 7);
  assert(Track::FromProto(proto) == track);
  assert(Track::FromProto(snapshot::manager::core::v1::Track{}).IsRoot());
}

} // namespace

int main() {
  TestRootTrack();
  TestParentAndChild();
  TestPrefixRelations();
  TestParseRoundTripsText();
  TestParseRejectsMalformedText();
  TestRootHasNoParent();
  TestSubtreeIsContiguousInOrder();
  TestProtoConversion();

  std::cout << "snapshot_manager_unit_track: pass\n";
  return 0;
}
