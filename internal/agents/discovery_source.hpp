#pragma once

#include <string>
#include <vector>

#include "reactor/v1.hpp"

namespace reactor::agents {

/*
  Supplies the code units that should have agents. Called once per
  process start; the result is handed to Reconciler::Reconcile.
*/
class DiscoverySource {
 public:
  virtual ~DiscoverySource() = default;

  virtual std::vector<reactor::v1::DiscoveredUnit> Discover() = 0;
};

// Fixed list, for embedding and tests.
class StaticDiscovery final : public DiscoverySource {
 public:
  explicit StaticDiscovery(std::vector<reactor::v1::DiscoveredUnit> units) : units_(std::move(units)) {}

  std::vector<reactor::v1::DiscoveredUnit> Discover() override { return units_; }

 private:
  std::vector<reactor::v1::DiscoveredUnit> units_;
};

} // namespace reactor::agents
