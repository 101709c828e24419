#include "collectors/InterfaceCollector.hpp"
#include "util/Diag.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <utility>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#include <iphlpapi.h>
#else
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#if defined(__linux__)
#include <netpacket/packet.h>
#elif defined(__APPLE__)
#include <net/if_dl.h>
#endif
#endif

using netsnap::model::AddrFamily;
using netsnap::model::IfAddrEntry;
using netsnap::model::InterfaceInfo;

namespace netsnap::collectors {

std::vector<InterfaceInfo> build_interface_table(const std::vector<IfAddrEntry>& entries) {
  std::vector<std::string> order;
  for (const auto& e : entries) {
    bool seen = false;
    for (const auto& n : order) if (n == e.name) { seen = true; break; }
    if (!seen) order.push_back(e.name);
  }

  std::vector<InterfaceInfo> out;
  for (const auto& name : order) {
    const IfAddrEntry* inet = nullptr;
    const IfAddrEntry* link = nullptr;
    for (const auto& e : entries) {
      if (e.name != name) continue;
      if (!inet && e.family == AddrFamily::Inet) inet = &e;
      if (!link && e.family == AddrFamily::Link && !e.addr.empty()) link = &e;
    }
    if (!inet) continue;
    InterfaceInfo info;
    info.name = name;
    info.ipv4 = inet->addr;
    info.netmask = inet->netmask.empty() ? std::string("N/A") : inet->netmask;
    info.broadcast = inet->broadcast.empty() ? std::string("N/A") : inet->broadcast;
    if (link) info.mac = link->addr;
    out.push_back(std::move(info));
  }
  return out;
}

static std::string format_mac(const unsigned char* bytes, size_t len) {
  std::string mac;
  char part[4];
  for (size_t i = 0; i < len; ++i) {
    std::snprintf(part, sizeof(part), i ? ":%02x" : "%02x", bytes[i]);
    mac += part;
  }
  return mac;
}

#ifndef _WIN32

static std::string sockaddr_text(const sockaddr* sa) {
  if (!sa) return {};
  char buf[INET6_ADDRSTRLEN] = {0};
  if (sa->sa_family == AF_INET) {
    auto* in = reinterpret_cast<const sockaddr_in*>(sa);
    if (::inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf))) return buf;
  } else if (sa->sa_family == AF_INET6) {
    auto* in6 = reinterpret_cast<const sockaddr_in6*>(sa);
    if (::inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf))) return buf;
  }
  return {};
}

namespace {

// Owns the list returned by getifaddrs(3).
class IfAddrsList {
public:
  IfAddrsList() = default;
  ~IfAddrsList() { if (head_) ::freeifaddrs(head_); }
  IfAddrsList(const IfAddrsList&) = delete;
  IfAddrsList& operator=(const IfAddrsList&) = delete;

  bool load() { return ::getifaddrs(&head_) == 0; }
  [[nodiscard]] const ifaddrs* head() const { return head_; }

private:
  ifaddrs* head_{nullptr};
};

} // namespace

bool enumerate_addresses(std::vector<IfAddrEntry>& out, std::string& err) {
  out.clear();
  IfAddrsList list;
  if (!list.load()) {
    err = std::string("getifaddrs: ") + std::strerror(errno);
    return false;
  }
  for (const ifaddrs* a = list.head(); a; a = a->ifa_next) {
    if (!a->ifa_name || !a->ifa_addr) continue;
    IfAddrEntry e;
    e.name = a->ifa_name;
    const int fam = a->ifa_addr->sa_family;
    if (fam == AF_INET || fam == AF_INET6) {
      e.family = fam == AF_INET ? AddrFamily::Inet : AddrFamily::Inet6;
      e.addr = sockaddr_text(a->ifa_addr);
      e.netmask = sockaddr_text(a->ifa_netmask);
      if ((a->ifa_flags & IFF_BROADCAST) && a->ifa_broadaddr)
        e.broadcast = sockaddr_text(a->ifa_broadaddr);
#if defined(__linux__)
    } else if (fam == AF_PACKET) {
      auto* ll = reinterpret_cast<const sockaddr_ll*>(a->ifa_addr);
      e.family = AddrFamily::Link;
      e.addr = format_mac(ll->sll_addr, ll->sll_halen);
#elif defined(__APPLE__)
    } else if (fam == AF_LINK) {
      auto* dl = reinterpret_cast<const sockaddr_dl*>(a->ifa_addr);
      e.family = AddrFamily::Link;
      e.addr = format_mac(reinterpret_cast<const unsigned char*>(LLADDR(dl)), dl->sdl_alen);
#endif
    } else {
      continue;
    }
    out.push_back(std::move(e));
  }
  return true;
}

#else // _WIN32

static std::string narrow(const wchar_t* w) {
  if (!w) return {};
  int n = ::WideCharToMultiByte(CP_UTF8, 0, w, -1, nullptr, 0, nullptr, nullptr);
  if (n <= 1) return {};
  std::string s(static_cast<size_t>(n - 1), '\0');
  ::WideCharToMultiByte(CP_UTF8, 0, w, -1, s.data(), n, nullptr, nullptr);
  return s;
}

static std::string ipv4_text(const in_addr& a) {
  char buf[INET_ADDRSTRLEN] = {0};
  if (::inet_ntop(AF_INET, &a, buf, sizeof(buf))) return buf;
  return {};
}

static bool load_adapters(std::vector<unsigned char>& buffer, ULONG flags, std::string& err) {
  ULONG size = 15000;
  buffer.assign(size, 0);
  ULONG ret = ::GetAdaptersAddresses(AF_UNSPEC, flags, nullptr,
                                     reinterpret_cast<PIP_ADAPTER_ADDRESSES>(buffer.data()), &size);
  if (ret == ERROR_BUFFER_OVERFLOW) {
    buffer.resize(size);
    ret = ::GetAdaptersAddresses(AF_UNSPEC, flags, nullptr,
                                 reinterpret_cast<PIP_ADAPTER_ADDRESSES>(buffer.data()), &size);
  }
  if (ret != NO_ERROR) {
    err = "GetAdaptersAddresses failed with error " + std::to_string(ret);
    return false;
  }
  return true;
}

static std::string adapter_name(const IP_ADAPTER_ADDRESSES* ad) {
  std::string name = narrow(ad->FriendlyName);
  if (name.empty() && ad->AdapterName) name = ad->AdapterName;
  return name;
}

bool enumerate_adapter_gateways(std::vector<netsnap::model::GatewayEntry>& out, std::string& err) {
  using netsnap::model::GatewayFamily;
  std::vector<unsigned char> buffer;
  if (!load_adapters(buffer, GAA_FLAG_INCLUDE_GATEWAYS, err)) return false;
  bool have4 = false, have6 = false;
  for (auto* ad = reinterpret_cast<PIP_ADAPTER_ADDRESSES>(buffer.data()); ad; ad = ad->Next) {
    for (auto* g = ad->FirstGatewayAddress; g; g = g->Next) {
      const sockaddr* sa = g->Address.lpSockaddr;
      if (!sa) continue;
      char buf[INET6_ADDRSTRLEN] = {0};
      if (sa->sa_family == AF_INET && !have4) {
        const auto* in = reinterpret_cast<const sockaddr_in*>(sa);
        if (!::inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf))) continue;
        out.push_back({GatewayFamily::IPv4, buf, adapter_name(ad)});
        have4 = true;
      } else if (sa->sa_family == AF_INET6 && !have6) {
        const auto* in6 = reinterpret_cast<const sockaddr_in6*>(sa);
        if (!::inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf))) continue;
        out.push_back({GatewayFamily::IPv6, buf, adapter_name(ad)});
        have6 = true;
      }
    }
  }
  // IPv4 first regardless of adapter order
  if (out.size() == 2 && out[0].family == GatewayFamily::IPv6) std::swap(out[0], out[1]);
  return true;
}

bool enumerate_addresses(std::vector<IfAddrEntry>& out, std::string& err) {
  out.clear();
  std::vector<unsigned char> buffer;
  if (!load_adapters(buffer, GAA_FLAG_INCLUDE_PREFIX, err)) return false;
  for (auto* ad = reinterpret_cast<PIP_ADAPTER_ADDRESSES>(buffer.data()); ad; ad = ad->Next) {
    const std::string name = adapter_name(ad);
    for (auto* u = ad->FirstUnicastAddress; u; u = u->Next) {
      const sockaddr* sa = u->Address.lpSockaddr;
      if (!sa || sa->sa_family != AF_INET) continue;
      const auto* in = reinterpret_cast<const sockaddr_in*>(sa);
      IfAddrEntry e;
      e.name = name;
      e.family = AddrFamily::Inet;
      e.addr = ipv4_text(in->sin_addr);
      ULONG mask = 0;
      if (::ConvertLengthToIpv4Mask(u->OnLinkPrefixLength, &mask) == NO_ERROR) {
        in_addr m{}; m.s_addr = mask;
        in_addr b{}; b.s_addr = in->sin_addr.s_addr | ~mask;
        e.netmask = ipv4_text(m);
        e.broadcast = ipv4_text(b);
      }
      out.push_back(std::move(e));
    }
    if (ad->PhysicalAddressLength > 0) {
      IfAddrEntry e;
      e.name = name;
      e.family = AddrFamily::Link;
      e.addr = format_mac(ad->PhysicalAddress, ad->PhysicalAddressLength);
      out.push_back(std::move(e));
    }
  }
  return true;
}

#endif

bool InterfaceCollector::sample(netsnap::model::InterfaceTable& out) {
  out.interfaces.clear();
  out.error.clear();
  std::vector<IfAddrEntry> entries;
  if (!enumerate_addresses(entries, out.error)) {
    netsnap::util::diag("InterfaceCollector", out.error);
    return false;
  }
  out.interfaces = build_interface_table(entries);
  netsnap::util::diag("InterfaceCollector", std::to_string(entries.size()) + " addresses, " +
                      std::to_string(out.interfaces.size()) + " IPv4 interfaces");
  return true;
}

} // namespace netsnap::collectors
