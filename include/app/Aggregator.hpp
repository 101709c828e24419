#pragma once
#include <string>
#include "app/CommandRunner.hpp"
#include "collectors/GatewayCollector.hpp"
#include "collectors/InterfaceCollector.hpp"
#include "model/Snapshot.hpp"
#include "util/Platform.hpp"

namespace netsnap::app {

// Collects one Snapshot: routes, interfaces, ARP, DNS, gateways, in that
// order. A failing step leaves its own error in the snapshot and never stops
// the later steps.
class Aggregator {
public:
  Aggregator(netsnap::util::Platform platform, ICommandRunner& runner,
             std::string resolv_conf = "/etc/resolv.conf");

  [[nodiscard]] netsnap::model::Snapshot collect();

private:
  netsnap::util::Platform platform_;
  ICommandRunner& runner_;
  std::string resolv_conf_;
  netsnap::collectors::InterfaceCollector ifaces_{};
  netsnap::collectors::GatewayCollector gateways_{};
};

} // namespace netsnap::app
