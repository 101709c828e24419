#include "app/Aggregator.hpp"
#include "collectors/RouteCollector.hpp"
#include "collectors/TextCollector.hpp"
#include "util/Diag.hpp"

#include <utility>

namespace netsnap::app {

Aggregator::Aggregator(netsnap::util::Platform platform, ICommandRunner& runner, std::string resolv_conf)
    : platform_(platform), runner_(runner), resolv_conf_(std::move(resolv_conf)) {}

netsnap::model::Snapshot Aggregator::collect() {
  netsnap::model::Snapshot s;
  s.platform = platform_;
  netsnap::util::diag("Aggregator", std::string("collecting on ") + netsnap::util::platform_name(platform_));

  s.routes = netsnap::collectors::collect_routing_table(platform_, runner_);
  if (!ifaces_.sample(s.interfaces)) {
    netsnap::util::diag("Aggregator", "interface enumeration failed, continuing");
  }
  s.arp = netsnap::collectors::collect_arp_text(platform_, runner_);
  s.dns = netsnap::collectors::collect_dns_text(platform_, runner_, resolv_conf_);
  if (!gateways_.sample(platform_, runner_, s.gateways)) {
    netsnap::util::diag("Aggregator", "no gateway source available");
  }
  return s;
}

} // namespace netsnap::app
