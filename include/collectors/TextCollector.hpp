#pragma once
#include "app/CommandRunner.hpp"
#include "util/Platform.hpp"
#include <string>

namespace netsnap::collectors {

// ARP cache as printed by `arp -a` (Windows) or `arp -n`. On failure the text
// is a single "Error getting ARP table: ..." line.
[[nodiscard]] std::string collect_arp_text(netsnap::util::Platform platform,
                                           netsnap::app::ICommandRunner& runner);

// Resolver configuration: `ipconfig /all` on Windows, otherwise the contents
// of resolv_conf. On failure the text is "Error getting DNS info: ...".
[[nodiscard]] std::string collect_dns_text(netsnap::util::Platform platform,
                                           netsnap::app::ICommandRunner& runner,
                                           const std::string& resolv_conf);

} // namespace netsnap::collectors
