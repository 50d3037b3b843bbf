#pragma once

#include <compare>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <vector>

#include "snapshot/manager/core/v1/types.pb.h"

namespace snapshot::model {

/*
  Track

  Ordered child indices from a sandbox root to a descendant snapshot.
  The empty track is the root. Parent lookup is "drop the last index",
  so the tree never needs parent back-pointers.
*/
class Track {
 public:
  using Index = std::uint32_t;

  Track() = default;
  Track(std::initializer_list<Index> indices) : indices_(indices) {
  }
  explicit Track(std::vector<Index> indices) : indices_(std::move(indices)) {
  }

  static Track Root() {
    return {};
  }

  bool IsRoot() const {
    return indices_.empty();
  }

  std::size_t Depth() const {
    return indices_.size();
  }

  const std::vector<Index>& Indices() const {
    return indices_;
  }

  // Index of this track within its parent. Precondition: !IsRoot().
  Index Last() const;

  Track Parent() const;
  Track Child(Index index) const;

  // True iff `other` extends this track by one or more indices.
  bool IsStrictPrefixOf(const Track& other) const;
  bool IsPrefixOf(const Track& other) const;

  // "[0,2]"; the root is "[]".
  std::string ToString() const;
  static Track Parse(const std::string& text);

  snapshot::manager::core::v1::Track ToProto() const;
  static Track                       FromProto(const snapshot::manager::core::v1::Track& track);

  friend bool                 operator==(const Track&, const Track&) = default;
  friend std::strong_ordering operator<=>(const Track&, const Track&) = default;

 private:
  std::vector<Index> indices_;
};

} // namespace snapshot::model
