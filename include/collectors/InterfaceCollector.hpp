#pragma once
#include "model/Gateway.hpp"
#include "model/Interface.hpp"
#include <string>
#include <vector>

namespace netsnap::collectors {

// Fold raw per-address records into one row per interface. Interfaces with no
// IPv4 address are dropped; missing netmask/broadcast become "N/A".
[[nodiscard]] std::vector<netsnap::model::InterfaceInfo>
build_interface_table(const std::vector<netsnap::model::IfAddrEntry>& entries);

// Enumerate every address the OS reports (getifaddrs / GetAdaptersAddresses).
bool enumerate_addresses(std::vector<netsnap::model::IfAddrEntry>& out, std::string& err);

#ifdef _WIN32
// First IPv4 and IPv6 gateway reported by any adapter.
bool enumerate_adapter_gateways(std::vector<netsnap::model::GatewayEntry>& out, std::string& err);
#endif

class InterfaceCollector {
public:
  // Returns false when enumeration failed; out.error then carries the reason.
  bool sample(netsnap::model::InterfaceTable& out);
};

} // namespace netsnap::collectors
