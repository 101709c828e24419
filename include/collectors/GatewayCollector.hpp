#pragma once
#include "app/CommandRunner.hpp"
#include "model/Gateway.hpp"
#include "util/Platform.hpp"
#include <optional>
#include <string_view>
#include <vector>

namespace netsnap::collectors {

// Default IPv4 gateway from /proc/net/route text (first RTF_GATEWAY row with a zero destination and mask).
[[nodiscard]] std::optional<netsnap::model::GatewayEntry> parse_proc_net_route(std::string_view text);

// Default IPv6 gateway from /proc/net/ipv6_route text (first ::/0 row with a non-zero next hop).
[[nodiscard]] std::optional<netsnap::model::GatewayEntry> parse_proc_net_ipv6_route(std::string_view text);

// "gateway:" / "interface:" lines of BSD `route -n get default`.
[[nodiscard]] std::optional<netsnap::model::GatewayEntry>
parse_route_get(std::string_view text, netsnap::model::GatewayFamily family);

class GatewayCollector {
public:
  // Fills out with at most one entry per family, IPv4 first. Returns false
  // when no source could be read at all.
  bool sample(netsnap::util::Platform platform, netsnap::app::ICommandRunner& runner,
              std::vector<netsnap::model::GatewayEntry>& out);
private:
  bool sample_linux(std::vector<netsnap::model::GatewayEntry>& out);
  bool sample_darwin(netsnap::app::ICommandRunner& runner, std::vector<netsnap::model::GatewayEntry>& out);
};

} // namespace netsnap::collectors
