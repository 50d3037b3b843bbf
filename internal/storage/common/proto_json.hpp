#pragma once

#include <google/protobuf/message.h>
#include <google/protobuf/util/json_util.h>

#include <filesystem>
#include <stdexcept>
#include <string>

#include "internal/storage/common/arrow_utils.hpp"

namespace snapshot::storage::common {

/*
  Configuration records are persisted as protobuf JSON, one file per record.
*/
inline void SaveProtoJson(const std::filesystem::path& path, const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("serialize " + path.string() + ": " + std::string(status.message()));
  }
  WriteFileAtomic(path, json, true);
}

inline void LoadProtoJson(const std::filesystem::path& path, google::protobuf::Message* message) {
  const auto json = ReadFileToString(path);

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(json, message, options);
  if (!status.ok()) {
    throw std::runtime_error("parse " + path.string() + ": " + std::string(status.message()));
  }
}

} // namespace snapshot::storage::common
