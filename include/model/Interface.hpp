#pragma once
#include <optional>
#include <string>
#include <vector>

namespace netsnap::model {

enum class AddrFamily { Inet, Inet6, Link, Other };

// One address record as reported by the OS, before folding per interface.
struct IfAddrEntry {
  std::string name;
  AddrFamily  family{AddrFamily::Other};
  std::string addr;      // dotted quad, IPv6 text or MAC
  std::string netmask;   // empty if not reported
  std::string broadcast; // empty if not reported
};

struct InterfaceInfo {
  std::string name;
  std::string ipv4;
  std::string netmask;
  std::optional<std::string> mac;
  std::string broadcast{"N/A"};
};

struct InterfaceTable {
  std::vector<InterfaceInfo> interfaces; // enumeration order, IPv4-only
  std::string error;                     // empty when enumeration succeeded
};

} // namespace netsnap::model
