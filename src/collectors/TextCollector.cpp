#include "collectors/TextCollector.hpp"
#include "util/Diag.hpp"
#include "util/Procfs.hpp"
#include "util/Text.hpp"

using netsnap::util::Platform;

namespace netsnap::collectors {

std::string collect_arp_text(Platform platform, netsnap::app::ICommandRunner& runner) {
  const char* command = platform == Platform::Windows ? "arp -a" : "arp -n";
  auto res = runner.run(command);
  if (!res.ok) {
    netsnap::util::diag("ArpCollector", res.error);
    return "Error getting ARP table: " + res.error;
  }
  return res.output;
}

std::string collect_dns_text(Platform platform, netsnap::app::ICommandRunner& runner,
                             const std::string& resolv_conf) {
  if (platform == Platform::Windows) {
    auto res = runner.run("ipconfig /all");
    if (!res.ok) {
      netsnap::util::diag("DnsCollector", res.error);
      return "Error getting DNS info: " + res.error;
    }
    return res.output;
  }
  std::string err;
  auto txt = netsnap::util::read_file_string(resolv_conf, &err);
  if (!txt) {
    netsnap::util::diag("DnsCollector", resolv_conf + ": " + err);
    return "Error getting DNS info: " + resolv_conf + ": " + err;
  }
  return netsnap::util::sanitize_utf8(*txt);
}

} // namespace netsnap::collectors
