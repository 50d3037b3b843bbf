#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>
#include <unordered_set>

#include "internal/mets/file_group_naming.hpp"

namespace snapshot::config {

using snapshot::runtime::config::RuntimeConfig;

namespace {

constexpr const char* kDefaultBindAddress       = "0.0.0.0:50061";
constexpr const char* kDefaultProjectsFolder    = "projects";
constexpr const char* kDefaultCollectionsFolder = "collections";
constexpr const char* kDefaultMetsFileName      = "mets.xml";
constexpr const char* kDefaultMetsGroup         = "ocr4all";
constexpr const char* kDefaultFileGroupTemplate = "{group}-{track}";
constexpr uint32_t    kDefaultWorkerThreads     = 2;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("1" for an id must not become 1.0)
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ApplyDefaults(&config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  if (config->server().bind_address().empty()) {
    config->mutable_server()->set_bind_address(kDefaultBindAddress);
  }

  auto* workspace = config->mutable_workspace();
  if (workspace->projects_folder().empty()) {
    workspace->set_projects_folder(kDefaultProjectsFolder);
  }
  if (workspace->collections_folder().empty()) {
    workspace->set_collections_folder(kDefaultCollectionsFolder);
  }

  auto* defaults = config->mutable_sandbox_defaults();
  if (defaults->mets_file_name().empty()) {
    defaults->set_mets_file_name(kDefaultMetsFileName);
  }
  if (defaults->mets_group().empty()) {
    defaults->set_mets_group(kDefaultMetsGroup);
  }
  if (defaults->file_group_template().empty()) {
    defaults->set_file_group_template(kDefaultFileGroupTemplate);
  }

  if (config->scheduler().worker_threads() == 0) {
    config->mutable_scheduler()->set_worker_threads(kDefaultWorkerThreads);
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.workspace().root().empty()) {
    throw std::runtime_error("Invalid configuration: workspace.root is required");
  }

  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path is required");
  }

  try {
    snapshot::mets::ValidateFileGroupTemplate(config.sandbox_defaults().file_group_template());
  } catch (const std::exception& e) {
    throw std::runtime_error("Invalid configuration: sandbox_defaults.file_group_template: " + std::string(e.what()));
  }

  std::unordered_set<std::string> provider_ids;
  for (const auto& provider : config.providers()) {
    if (provider.id().empty()) {
      throw std::runtime_error("Invalid configuration: providers[].id is required");
    }
    if (!provider_ids.insert(provider.id()).second) {
      throw std::runtime_error("Invalid configuration: duplicate provider id " + provider.id());
    }
    if (provider.builtin() == snapshot::runtime::config::BUILTIN_PROVIDER_UNSPECIFIED) {
      throw std::runtime_error("Invalid configuration: provider " + provider.id() + " has no builtin implementation");
    }
  }
}

} // namespace snapshot::config
