#include "file_group_naming.hpp"

#include <charconv>
#include <vector>

#include "internal/util/errors.hpp"

namespace snapshot::mets {

namespace {

constexpr const char* kRootToken = "root";

std::size_t CountOccurrences(const std::string& text, const std::string& token) {
  std::size_t count = 0;
  for (auto pos = text.find(token); pos != std::string::npos; pos = text.find(token, pos + token.size())) {
    ++count;
  }
  return count;
}

std::string ReplaceAll(std::string text, const std::string& token, const std::string& value) {
  for (auto pos = text.find(token); pos != std::string::npos; pos = text.find(token, pos + value.size())) {
    text.replace(pos, token.size(), value);
  }
  return text;
}

std::string TrackToken(const model::Track& track) {
  if (track.IsRoot()) {
    return kRootToken;
  }
  std::string token;
  for (auto index : track.Indices()) {
    if (!token.empty()) token += '-';
    token += std::to_string(index);
  }
  return token;
}

} // namespace

void ValidateFileGroupTemplate(const std::string& file_group_template) {
  if (CountOccurrences(file_group_template, kTrackPlaceholder) != 1) {
    throw util::BadRequest("file group template must contain {track} exactly once: " + file_group_template);
  }

  // any other brace after removing the known placeholders is an unknown placeholder
  const auto stripped = ReplaceAll(ReplaceAll(file_group_template, kTrackPlaceholder, ""), kGroupPlaceholder, "");
  if (stripped.find_first_of("{}") != std::string::npos) {
    throw util::BadRequest("file group template has unknown placeholder: " + file_group_template);
  }
}

void ValidateMetsGroup(const std::string& group) {
  if (group.find_first_of("{}") != std::string::npos) {
    throw util::BadRequest("METS group must not contain braces: " + group);
  }
}

std::string FileGroupIdFor(const std::string& file_group_template, const std::string& group, const model::Track& track) {
  ValidateFileGroupTemplate(file_group_template);
  return ReplaceAll(ReplaceAll(file_group_template, kTrackPlaceholder, TrackToken(track)), kGroupPlaceholder, group);
}

std::optional<model::Track> TrackForFileGroup(const std::string& file_group_template, const std::string& group, const std::string& file_group_id) {
  ValidateFileGroupTemplate(file_group_template);

  // split at {track} before the group is expanded into the halves
  const std::string token  = kTrackPlaceholder;
  const auto        at     = file_group_template.find(token);
  const auto        prefix = ReplaceAll(file_group_template.substr(0, at), kGroupPlaceholder, group);
  const auto        suffix = ReplaceAll(file_group_template.substr(at + token.size()), kGroupPlaceholder, group);

  if (file_group_id.size() < prefix.size() + suffix.size() + 1 || file_group_id.compare(0, prefix.size(), prefix) != 0 ||
      file_group_id.compare(file_group_id.size() - suffix.size(), suffix.size(), suffix) != 0) {
    return std::nullopt;
  }

  const auto middle = file_group_id.substr(prefix.size(), file_group_id.size() - prefix.size() - suffix.size());
  if (middle == kRootToken) {
    return model::Track::Root();
  }

  std::vector<model::Track::Index> indices;
  const char*                      cursor = middle.data();
  const char*                      end    = middle.data() + middle.size();
  while (cursor < end) {
    model::Track::Index value = 0;
    auto [ptr, ec]            = std::from_chars(cursor, end, value);
    if (ec != std::errc{}) {
      return std::nullopt;
    }
    indices.push_back(value);
    cursor = ptr;
    if (cursor < end) {
      if (*cursor != '-' || cursor + 1 == end) {
        return std::nullopt;
      }
      ++cursor;
    }
  }

  model::Track track(std::move(indices));
  // rejects non-canonical spellings such as leading zeros
  if (TrackToken(track) != middle) {
    return std::nullopt;
  }
  return track;
}

} // namespace snapshot::mets
