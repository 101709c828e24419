#include "app/Aggregator.hpp"
#include "app/CommandRunner.hpp"
#include "collectors/InterfaceCollector.hpp"
#include "model/Snapshot.hpp"
#include "ui/Config.hpp"
#include "ui/Report.hpp"
#include "ui/Terminal.hpp"
#include "util/Diag.hpp"
#include "util/Platform.hpp"

#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

// Capabilities the report cannot do without. Returns the missing ones as
// "name (reason)" strings.
static std::vector<std::string> missing_capabilities() {
  std::vector<std::string> missing;
  std::vector<netsnap::model::IfAddrEntry> probe;
  std::string err;
  if (!netsnap::collectors::enumerate_addresses(probe, err)) {
    missing.push_back("interface enumeration (" + err + ")");
  }
  return missing;
}

int main(int argc, char** argv) {
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "-h" || a == "--help") {
      std::cout << "Usage: netsnap\n";
      std::cout << "Prints routing table, interfaces, default gateways, ARP cache and DNS configuration.\n";
      std::cout << "Config: $XDG_CONFIG_HOME/netsnap/config.toml (NETSNAP_* env vars as fallback)\n";
      return 0;
    }
  }

  const auto cfg = netsnap::ui::load_settings();
  netsnap::util::set_verbose(cfg.verbose);
  netsnap::ui::set_color_enabled(cfg.color && netsnap::ui::tty_stdout());

  if (auto missing = missing_capabilities(); !missing.empty()) {
    std::fprintf(stderr, "Missing capabilities:\n");
    for (const auto& m : missing) std::fprintf(stderr, "- %s\n", m.c_str());
    return 1;
  }

  const auto platform = netsnap::util::detect_platform();
  netsnap::app::ShellCommandRunner runner;
  netsnap::app::Aggregator aggregator(platform, runner, cfg.resolv_conf);
  const auto snapshot = aggregator.collect();

  for (const auto& line : netsnap::ui::render_report(snapshot, cfg)) {
    std::cout << line << '\n';
  }
  std::cout.flush();
  return 0;
}
