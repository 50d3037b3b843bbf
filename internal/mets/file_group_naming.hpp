#pragma once

#include <optional>
#include <string>

#include "internal/model/track.hpp"

namespace snapshot::mets {

/*
  File group ids of a sandbox are derived from its template:

      "{group}-{track}"  with group "ocr4all":  []    -> "ocr4all-root"
                                                [0,2] -> "ocr4all-0-2"

  The mapping is a pure function of (template, group, track) and is
  injective over tracks, so it can be inverted.
*/

inline constexpr const char* kTrackPlaceholder = "{track}";
inline constexpr const char* kGroupPlaceholder = "{group}";

// Throws util::BadRequest unless the template has exactly one {track}
// and no placeholders other than {group}.
void ValidateFileGroupTemplate(const std::string& file_group_template);

// Throws util::BadRequest when the METS group contains a brace.
void ValidateMetsGroup(const std::string& group);

std::string FileGroupIdFor(const std::string& file_group_template, const std::string& group, const model::Track& track);

// Inverse of FileGroupIdFor; nullopt for ids the template cannot produce.
std::optional<model::Track> TrackForFileGroup(const std::string& file_group_template, const std::string& group, const std::string& file_group_id);

} // namespace snapshot::mets
