#include "collectors/GatewayCollector.hpp"
#include "collectors/InterfaceCollector.hpp"
#include "util/Diag.hpp"
#include "util/Procfs.hpp"
#include "util/Text.hpp"

#include <array>
#include <charconv>
#include <cstdint>
#include <cstring>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#include <netinet/in.h>
#endif

using netsnap::model::GatewayEntry;
using netsnap::model::GatewayFamily;
using netsnap::util::split_lines;
using netsnap::util::split_ws;
using netsnap::util::trim;

namespace netsnap::collectors {

static constexpr uint32_t kRtfGateway = 0x0002;

static bool parse_hex_u32(std::string_view s, uint32_t& v) {
  if (s.empty()) return false;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v, 16);
  return ec == std::errc() && ptr == s.data() + s.size();
}

std::optional<GatewayEntry> parse_proc_net_route(std::string_view text) {
  int line_no = 0;
  for (auto line : split_lines(text)) {
    if (++line_no == 1) continue; // header
    // Iface Destination Gateway Flags RefCnt Use Metric Mask MTU Window IRTT
    auto f = split_ws(line);
    if (f.size() < 8) continue;
    uint32_t dst = 0, gw = 0, flags = 0, mask = 0;
    if (!parse_hex_u32(f[1], dst) || !parse_hex_u32(f[2], gw) ||
        !parse_hex_u32(f[3], flags) || !parse_hex_u32(f[7], mask)) continue;
    if (dst != 0 || mask != 0 || !(flags & kRtfGateway)) continue;
    // The kernel prints the address word in host byte order.
    in_addr a{};
    a.s_addr = gw;
    char buf[INET_ADDRSTRLEN] = {0};
    if (!::inet_ntop(AF_INET, &a, buf, sizeof(buf))) continue;
    return GatewayEntry{GatewayFamily::IPv4, buf, f[0]};
  }
  return std::nullopt;
}

static bool parse_hex128(std::string_view s, std::array<unsigned char, 16>& out) {
  if (s.size() != 32) return false;
  for (size_t i = 0; i < 16; ++i) {
    uint32_t byte = 0;
    auto part = s.substr(i * 2, 2);
    auto [ptr, ec] = std::from_chars(part.data(), part.data() + 2, byte, 16);
    if (ec != std::errc() || ptr != part.data() + 2) return false;
    out[i] = static_cast<unsigned char>(byte);
  }
  return true;
}

std::optional<GatewayEntry> parse_proc_net_ipv6_route(std::string_view text) {
  for (auto line : split_lines(text)) {
    // dest plen src plen nexthop metric refcnt use flags iface
    auto f = split_ws(line);
    if (f.size() < 10) continue;
    std::array<unsigned char, 16> dst{}, hop{};
    if (!parse_hex128(f[0], dst) || !parse_hex128(f[4], hop)) continue;
    if (f[1] != "00") continue;
    bool dst_zero = true, hop_zero = true;
    for (size_t i = 0; i < 16; ++i) {
      if (dst[i]) dst_zero = false;
      if (hop[i]) hop_zero = false;
    }
    if (!dst_zero || hop_zero) continue;
    in6_addr a{};
    std::memcpy(&a, hop.data(), hop.size());
    char buf[INET6_ADDRSTRLEN] = {0};
    if (!::inet_ntop(AF_INET6, &a, buf, sizeof(buf))) continue;
    return GatewayEntry{GatewayFamily::IPv6, buf, f[9]};
  }
  return std::nullopt;
}

std::optional<GatewayEntry> parse_route_get(std::string_view text, GatewayFamily family) {
  std::string gateway, iface;
  for (auto raw : split_lines(text)) {
    auto line = trim(raw);
    auto colon = line.find(':');
    if (colon == std::string_view::npos) continue;
    auto key = trim(line.substr(0, colon));
    auto val = trim(line.substr(colon + 1));
    if (key == "gateway" && gateway.empty()) gateway = std::string(val);
    else if (key == "interface" && iface.empty()) iface = std::string(val);
  }
  if (gateway.empty()) return std::nullopt;
  return GatewayEntry{family, gateway, iface};
}

bool GatewayCollector::sample_linux(std::vector<GatewayEntry>& out) {
  bool any_read = false;
  std::string err;
  if (auto txt = netsnap::util::read_file_string("/proc/net/route", &err)) {
    any_read = true;
    if (auto gw = parse_proc_net_route(*txt)) out.push_back(*gw);
  } else {
    netsnap::util::diag("GatewayCollector", "/proc/net/route: " + err);
  }
  if (auto txt = netsnap::util::read_file_string("/proc/net/ipv6_route", &err)) {
    any_read = true;
    if (auto gw = parse_proc_net_ipv6_route(*txt)) out.push_back(*gw);
  } else {
    netsnap::util::diag("GatewayCollector", "/proc/net/ipv6_route: " + err);
  }
  return any_read;
}

bool GatewayCollector::sample_darwin(netsnap::app::ICommandRunner& runner, std::vector<GatewayEntry>& out) {
  bool any_ok = false;
  struct Query { const char* command; GatewayFamily family; };
  static constexpr Query queries[] = {
    {"route -n get default", GatewayFamily::IPv4},
    {"route -n get -inet6 default", GatewayFamily::IPv6},
  };
  for (const auto& q : queries) {
    auto res = runner.run(q.command);
    if (!res.ok) {
      netsnap::util::diag("GatewayCollector", res.error);
      continue;
    }
    any_ok = true;
    if (auto gw = parse_route_get(res.output, q.family)) out.push_back(*gw);
  }
  return any_ok;
}

bool GatewayCollector::sample(netsnap::util::Platform platform, netsnap::app::ICommandRunner& runner,
                              std::vector<GatewayEntry>& out) {
  out.clear();
  switch (platform) {
    case netsnap::util::Platform::Linux:
      return sample_linux(out);
    case netsnap::util::Platform::Darwin:
      return sample_darwin(runner, out);
    case netsnap::util::Platform::Windows: {
#ifdef _WIN32
      std::string err;
      if (!enumerate_adapter_gateways(out, err)) {
        netsnap::util::diag("GatewayCollector", err);
        return false;
      }
      return true;
#else
      return false;
#endif
    }
    case netsnap::util::Platform::Other:
      break;
  }
  return false;
}

} // namespace netsnap::collectors
