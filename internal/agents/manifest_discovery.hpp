#pragma once

#include <string>
#include <vector>

#include "internal/agents/discovery_source.hpp"

namespace reactor::agents {

/*
  Reads units from a YAML manifest:

    units:
      - id: fn_parse
        node_type: function
        name: parse
        full_name: pkg.parse
        file_path: src/pkg.py
        parent_id: mod_pkg
        range: {start_line: 1, end_line: 20, start_byte: 0, end_byte: 512}

  Only id is required. The file is read on every Discover() call.
  Throws std::runtime_error when it cannot be read and
  util::InvalidArgument for a malformed or unknown entry key.
*/
class ManifestDiscovery final : public DiscoverySource {
 public:
  explicit ManifestDiscovery(std::string path);

  std::vector<reactor::v1::DiscoveredUnit> Discover() override;

  static std::vector<reactor::v1::DiscoveredUnit> ParseManifest(const std::string& yaml_text);

 private:
  std::string path_;
};

} // namespace reactor::agents
