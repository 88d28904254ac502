#include "internal/agents/manifest_discovery.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace {

using reactor::agents::ManifestDiscovery;

template <typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const std::exception&) {
    return true;
  }
  return false;
}

void TestManifestEntriesBecomeUnits() {
  auto units = ManifestDiscovery::ParseManifest(R"(units:
  - id: mod_app
    node_type: module
    file_path: src/app.py
  - id: fn_main
    node_type: function
    name: main
    full_name: app.main
    file_path: src/app.py
    parent_id: mod_app
    range: {start_line: 12, end_line: 40}
)");

  assert(units.size() == 2);
  assert(units[0].id() == "mod_app");
  assert(units[0].identity().node_type() == "module");
  assert(!units[0].identity().has_range());

  const auto& fn = units[1].identity();
  assert(fn.full_name() == "app.main");
  assert(fn.parent_id() == "mod_app");
  assert(fn.range().start_line() == 12 && fn.range().end_line() == 40);
  assert(fn.range().start_byte() == 0);
}

void TestEmptyManifestHasNoUnits() {
  assert(ManifestDiscovery::ParseManifest("").empty());
  assert(ManifestDiscovery::ParseManifest("units: []\n").empty());
}

void TestMalformedEntriesAreRejected() {
  assert(Throws([] { (void)ManifestDiscovery::ParseManifest("units:\n  - node_type: function\n"); }));
  assert(Throws([] { (void)ManifestDiscovery::ParseManifest("units:\n  - id: a\n    colour: red\n"); }));
  assert(Throws([] { (void)ManifestDiscovery::ParseManifest("units:\n  - id: a\n    range: {start_line: -3}\n"); }));
  assert(Throws([] { (void)ManifestDiscovery::ParseManifest("units: fn_a\n"); }));
}

void TestDiscoverReadsTheFile() {
  const auto dir = std::filesystem::temp_directory_path() / "agent_reactor_manifest_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / "units.yaml";
  {
    std::ofstream out(path);
    out << "units:\n  - id: fn_a\n    file_path: a.py\n";
  }

  ManifestDiscovery discovery(path.string());
  auto              units = discovery.Discover();
  assert(units.size() == 1 && units[0].identity().file_path() == "a.py");

  ManifestDiscovery missing((dir / "absent.yaml").string());
  assert(Throws([&] { (void)missing.Discover(); }));
}

} // namespace

int main() {
  TestManifestEntriesBecomeUnits();
  TestEmptyManifestHasNoUnits();
  TestMalformedEntriesAreRejected();
  TestDiscoverReadsTheFile();

  std::cout << "agent_reactor_unit_manifest_discovery: pass\n";
  return 0;
}
