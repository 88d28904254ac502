#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <array>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "internal/util/errors.hpp"

namespace reactor::config {

namespace {

using reactor::runtime::config::RuntimeConfig;

constexpr std::array<std::string_view, 10> kLogLevels = {"", "trace", "debug", "info", "warn", "warning", "err", "error", "critical", "off"};

std::string Join(const std::string& path, const std::string& key) {
  return path.empty() ? key : path + "." + key;
}

// Plain scalars become bool, number or string by their text. Quoted and
// "!"-tagged scalars are always strings, so swarm_id: "42" stays a string.
void ConvertScalar(const YAML::Node& node, google::protobuf::Value* out) {
  const std::string& text = node.Scalar();
  if (node.Tag() == "!") {
    out->set_string_value(text);
    return;
  }
  if (text == "true" || text == "false") {
    out->set_bool_value(text == "true");
    return;
  }

  char*        end    = nullptr;
  const double number = std::strtod(text.c_str(), &end);
  if (!text.empty() && end != nullptr && *end == '\0') {
    out->set_number_value(number);
    return;
  }
  out->set_string_value(text);
}

void Convert(const YAML::Node& node, const std::string& path, google::protobuf::Value* out) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      // a key with no value keeps the field's default
      out->set_null_value(google::protobuf::NULL_VALUE);
      return;
    case YAML::NodeType::Scalar:
      ConvertScalar(node, out);
      return;
    case YAML::NodeType::Sequence: {
      auto* list = out->mutable_list_value();
      for (std::size_t i = 0; i < node.size(); ++i) {
        Convert(node[i], path + "[" + std::to_string(i) + "]", list->add_values());
      }
      return;
    }
    case YAML::NodeType::Map: {
      auto* fields = out->mutable_struct_value()->mutable_fields();
      for (const auto& entry : node) {
        if (!entry.first.IsScalar()) {
          throw std::runtime_error("Invalid configuration: non-scalar key under '" + path + "'");
        }
        const auto key = entry.first.Scalar();
        Convert(entry.second, Join(path, key), &(*fields)[key]);
      }
      return;
    }
    default:
      throw std::runtime_error("Invalid configuration: unsupported YAML node at '" + path + "'");
  }
}

RuntimeConfig FromYamlNode(const YAML::Node& yaml) {
  RuntimeConfig config;
  if (yaml.IsNull()) return config;
  if (!yaml.IsMap()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  google::protobuf::Value document;
  Convert(yaml, "", &document);

  std::string json;
  if (auto status = google::protobuf::util::MessageToJsonString(document, &json); !status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(status.message()));
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;
  if (auto status = google::protobuf::util::JsonStringToMessage(json, &config, options); !status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::Validate(config);
  return config;
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load YAML config " + path + ": " + e.what());
  }
  return FromYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return FromYamlNode(yaml);
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& runner = config.runner();
  if (runner.max_concurrency() > 1024) {
    throw util::InvalidArgument("runner.max_concurrency must be at most 1024");
  }
  if (runner.has_max_trigger_depth() && runner.max_trigger_depth() > 1000) {
    throw util::InvalidArgument("runner.max_trigger_depth must be at most 1000");
  }
  if (runner.swarm_id().find_first_of(" \t\r\n/") != std::string::npos) {
    throw util::InvalidArgument("runner.swarm_id must not contain whitespace or '/'");
  }
  if (config.observer().stream_capacity() > 1u << 20) {
    throw util::InvalidArgument("observer.stream_capacity must be at most 1048576");
  }

  bool known_level = false;
  for (auto level : kLogLevels) known_level = known_level || level == config.logging().level();
  if (!known_level) {
    throw util::InvalidArgument("logging.level '" + config.logging().level() + "' is not a log level");
  }
}

} // namespace reactor::config
