#include "manifest_discovery.hpp"

#include <yaml-cpp/yaml.h>

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace reactor::agents {

using observability::StringField;
using observability::UIntField;

namespace {

std::string Text(const YAML::Node& entry, const char* key, const std::string& where) {
  const auto node = entry[key];
  if (!node) return {};
  if (!node.IsScalar()) throw util::InvalidArgument(where + ": '" + key + "' must be a scalar");
  return node.Scalar();
}

uint32_t Number(const YAML::Node& range, const char* key, const std::string& where) {
  const auto node = range[key];
  if (!node) return 0;
  try {
    return node.as<uint32_t>();
  } catch (const YAML::Exception&) {
    throw util::InvalidArgument(where + ": range." + key + " must be a non-negative integer");
  }
}

reactor::v1::DiscoveredUnit ParseUnit(const YAML::Node& entry, std::size_t index) {
  const std::string where = "units[" + std::to_string(index) + "]";
  if (!entry.IsMap()) throw util::InvalidArgument(where + " must be a mapping");

  for (const auto& field : entry) {
    const auto key = field.first.Scalar();
    if (key != "id" && key != "node_type" && key != "name" && key != "full_name" && key != "file_path" && key != "parent_id" &&
        key != "range") {
      throw util::InvalidArgument(where + ": unknown key '" + key + "'");
    }
  }

  reactor::v1::DiscoveredUnit unit;
  unit.set_id(Text(entry, "id", where));
  if (unit.id().empty()) throw util::InvalidArgument(where + ": id is required");

  auto* identity = unit.mutable_identity();
  identity->set_node_type(Text(entry, "node_type", where));
  identity->set_name(Text(entry, "name", where));
  identity->set_full_name(Text(entry, "full_name", where));
  identity->set_file_path(Text(entry, "file_path", where));
  identity->set_parent_id(Text(entry, "parent_id", where));

  if (const auto range = entry["range"]) {
    if (!range.IsMap()) throw util::InvalidArgument(where + ": range must be a mapping");
    auto* r = identity->mutable_range();
    r->set_start_line(Number(range, "start_line", where));
    r->set_end_line(Number(range, "end_line", where));
    r->set_start_byte(Number(range, "start_byte", where));
    r->set_end_byte(Number(range, "end_byte", where));
  }
  return unit;
}

std::vector<reactor::v1::DiscoveredUnit> FromYaml(const YAML::Node& root) {
  std::vector<reactor::v1::DiscoveredUnit> units;
  if (root.IsNull()) return units;
  if (!root.IsMap()) throw util::InvalidArgument("discovery manifest: top level must be a mapping");

  const auto list = root["units"];
  if (!list || list.IsNull()) return units;
  if (!list.IsSequence()) throw util::InvalidArgument("discovery manifest: units must be a list");

  units.reserve(list.size());
  for (std::size_t i = 0; i < list.size(); ++i) units.push_back(ParseUnit(list[i], i));
  return units;
}

} // namespace

ManifestDiscovery::ManifestDiscovery(std::string path) : path_(std::move(path)) {
}

std::vector<reactor::v1::DiscoveredUnit> ManifestDiscovery::Discover() {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path_);
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to load discovery manifest " + path_ + ": " + e.what());
  }

  auto units = FromYaml(root);
  REACTOR_LOG_INFO("units discovered", {StringField("manifest", path_), UIntField("units", units.size())});
  return units;
}

std::vector<reactor::v1::DiscoveredUnit> ManifestDiscovery::ParseManifest(const std::string& yaml_text) {
  try {
    return FromYaml(YAML::Load(yaml_text));
  } catch (const YAML::Exception& e) {
    throw std::runtime_error("Failed to parse discovery manifest: " + std::string(e.what()));
  }
}

} // namespace reactor::agents
