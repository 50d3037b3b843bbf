#include "track.hpp"

#include <algorithm>
#include <charconv>
#include <sstream>

#include "internal/util/errors.hpp"

namespace snapshot::model {

Track::Index Track::Last() const {
  if (indices_.empty()) {
    throw util::BadRequest("root track has no index");
  }
  return indices_.back();
}

Track Track::Parent() const {
  if (indices_.empty()) {
    throw util::BadRequest("root track has no parent");
  }
  return Track(std::vector<Index>(indices_.begin(), indices_.end() - 1));
}

Track Track::Child(Index index) const {
  auto indices = indices_;
  indices.push_back(index);
  return Track(std::move(indices));
}

bool Track::IsPrefixOf(const Track& other) const {
  return indices_.size() <= other.indices_.size() && std::equal(indices_.begin(), indices_.end(), other.indices_.begin());
}

bool Track::IsStrictPrefixOf(const Track& other) const {
  return indices_.size() < other.indices_.size() && IsPrefixOf(other);
}

std::string Track::ToString() const {
  std::ostringstream out;
  out << '[';
  for (std::size_t i = 0; i < indices_.size(); ++i) {
    if (i > 0) out << ',';
    out << indices_[i];
  }
  out << ']';
  return out.str();
}

Track Track::Parse(const std::string& text) {
  if (text.size() < 2 || text.front() != '[' || text.back() != ']') {
    throw util::BadRequest("malformed track: " + text);
  }

  std::vector<Index> indices;
  const char*        cursor = text.data() + 1;
  const char*        end    = text.data() + text.size() - 1;
  while (cursor < end) {
    Index value  = 0;
    auto [ptr, ec] = std::from_chars(cursor, end, value);
    if (ec != std::errc{}) {
      throw util::BadRequest("malformed track: " + text);
    }
    indices.push_back(value);
    cursor = ptr;
    if (cursor < end) {
      if (*cursor != ',') {
        throw util::BadRequest("malformed track: " + text);
      }
      ++cursor;
      if (cursor == end) {
        throw util::BadRequest("malformed track: " + text);
      }
    }
  }
  return Track(std::move(indices));
}

snapshot::manager::core::v1::Track Track::ToProto() const {
  snapshot::manager::core::v1::Track track;
  for (auto index : indices_) {
    track.add_indices(index);
  }
  return track;
}

Track Track::FromProto(const snapshot::manager::core::v1::Track& track) {
  return Track(std::vector<Index>(track.indices().begin(), track.indices().end()));
}

} // namespace snapshot::model
