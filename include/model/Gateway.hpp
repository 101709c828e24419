#pragma once
#include <string>
#include <vector>

namespace netsnap::model {

enum class GatewayFamily { IPv4, IPv6 };

struct GatewayEntry {
  GatewayFamily family{GatewayFamily::IPv4};
  std::string address;
  std::string interface;

  bool operator==(const GatewayEntry&) const = default;
};

inline const char* family_label(GatewayFamily f) {
  return f == GatewayFamily::IPv4 ? "IPv4" : "IPv6";
}

} // namespace netsnap::model
