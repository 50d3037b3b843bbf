#pragma once

#include <filesystem>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace snapshot::storage::common {

/*
  Ids of projects, sandboxes and collections double as folder names.
*/
inline void ValidateFolderName(const std::string& what, const std::string& name) {
  if (name.empty()) {
    throw util::BadRequest(what + " id must not be empty");
  }
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw util::BadRequest(what + " id contains invalid character");
    }
  }
  if (name == "." || name == ".." || name.front() == '.') {
    throw util::BadRequest(what + " id must not start with a dot");
  }
}

inline std::filesystem::path ChildFolder(const std::filesystem::path& root, const std::string& what, const std::string& name) {
  ValidateFolderName(what, name);
  return root / name;
}

// Case-insensitive extension split: "page.001.XML" -> {"page.001", ".XML"}.
inline std::pair<std::string, std::string> SplitExtension(const std::string& file_name) {
  const auto dot = file_name.rfind('.');
  if (dot == std::string::npos || dot == 0) {
    return {file_name, ""};
  }
  return {file_name.substr(0, dot), file_name.substr(dot)};
}

} // namespace snapshot::storage::common
