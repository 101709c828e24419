#pragma once
#include <string>
#include <vector>
#include "model/Route.hpp"
#include "model/Interface.hpp"
#include "model/Gateway.hpp"
#include "util/Platform.hpp"

namespace netsnap::model {

struct Snapshot {
  netsnap::util::Platform platform{netsnap::util::Platform::Other};
  RouteTable routes;
  InterfaceTable interfaces;
  std::string arp;   // raw command output or an error line
  std::string dns;   // raw resolver text or an error line
  std::vector<GatewayEntry> gateways; // at most one per family
};

} // namespace netsnap::model
