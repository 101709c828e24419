#include "minitest.hpp"
#include "fake_runner.hpp"
#include "app/Aggregator.hpp"
#include "collectors/TextCollector.hpp"
#include "ui/Report.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using netsnap::util::Platform;

static fs::path test_dir() {
  return fs::temp_directory_path() / ("netsnap_test_agg_" + std::to_string(::getpid()));
}

static fs::path write_resolv(const char* tag, const std::string& body) {
  auto dir = test_dir();
  fs::create_directories(dir);
  auto p = dir / (std::string(tag) + ".conf");
  std::ofstream(p) << body;
  return p;
}

static bool contains_line(const std::vector<std::string>& lines, const std::string& needle) {
  for (const auto& l : lines) if (l.find(needle) != std::string::npos) return true;
  return false;
}

TEST(aggregator_arp_failure_keeps_routes) {
  auto resolv = write_resolv("partial", "nameserver 1.1.1.1\n");
  FakeRunner runner;
  runner.ok("netstat -rn", "default 10.0.0.1 0.0.0.0 UG 0 eth0\n");
  runner.fail("arp -n", "Command 'arp -n' returned non-zero exit status 127.");
  netsnap::app::Aggregator agg(Platform::Linux, runner, resolv.string());
  auto s = agg.collect();

  ASSERT_TRUE(s.routes.ok());
  ASSERT_EQ(s.routes.routes.size(), 1u);
  ASSERT_EQ(s.arp, "Error getting ARP table: Command 'arp -n' returned non-zero exit status 127.");
  ASSERT_EQ(s.dns, "nameserver 1.1.1.1\n");
  ASSERT_EQ(runner.calls.size(), 2u);
  ASSERT_EQ(runner.calls[0], "netstat -rn");
  ASSERT_EQ(runner.calls[1], "arp -n");

  netsnap::ui::Settings cfg{};
  auto lines = netsnap::ui::render_report(s, cfg);
  ASSERT_TRUE(contains_line(lines, "| default "));
  ASSERT_TRUE(contains_line(lines, "Error getting ARP table"));
  ASSERT_TRUE(contains_line(lines, "DNS INFORMATION"));
  fs::remove_all(test_dir());
}

TEST(aggregator_unsupported_platform_still_collects_the_rest) {
  auto resolv = write_resolv("other", "search example.org\n");
  FakeRunner runner;
  runner.ok("arp -n", "? (10.0.0.1) at 00:11:22:33:44:55 [ether] on eth0\n");
  netsnap::app::Aggregator agg(Platform::Other, runner, resolv.string());
  auto s = agg.collect();

  ASSERT_FALSE(s.routes.ok());
  ASSERT_EQ(s.routes.error.value_or(""), "Unsupported operating system");
  ASSERT_EQ(s.arp, "? (10.0.0.1) at 00:11:22:33:44:55 [ether] on eth0\n");
  ASSERT_EQ(s.dns, "search example.org\n");
  ASSERT_TRUE(s.gateways.empty());
  ASSERT_EQ(runner.calls.size(), 1u);
  fs::remove_all(test_dir());
}

TEST(aggregator_missing_resolv_conf_is_an_error_string) {
  FakeRunner runner;
  netsnap::app::Aggregator agg(Platform::Linux, runner, "/nonexistent/netsnap/resolv.conf");
  auto s = agg.collect();
  ASSERT_FALSE(s.routes.ok());
  ASSERT_TRUE(s.arp.rfind("Error getting ARP table: ", 0) == 0);
  ASSERT_TRUE(s.dns.rfind("Error getting DNS info: /nonexistent/netsnap/resolv.conf: ", 0) == 0);
}

TEST(aggregator_windows_commands) {
  FakeRunner runner;
  runner.ok("route print", "          0.0.0.0          0.0.0.0      10.0.0.1    10.0.0.5     25\r\n");
  runner.ok("arp -a", "Interface: 10.0.0.5 --- 0x5\r\n");
  runner.ok("ipconfig /all", "Windows IP Configuration\r\n");
  netsnap::app::Aggregator agg(Platform::Windows, runner);
  auto s = agg.collect();
  ASSERT_TRUE(s.routes.ok());
  ASSERT_EQ(s.routes.routes.size(), 1u);
  ASSERT_EQ(s.arp, "Interface: 10.0.0.5 --- 0x5\r\n");
  ASSERT_EQ(s.dns, "Windows IP Configuration\r\n");
  ASSERT_EQ(runner.calls[0], "route print");
  ASSERT_EQ(runner.calls[1], "arp -a");
  ASSERT_EQ(runner.calls[2], "ipconfig /all");
}

TEST(dns_text_from_a_directory_is_an_error_string) {
  auto dir = test_dir() / "resolv.d";
  fs::create_directories(dir);
  FakeRunner runner;
  auto dns = netsnap::collectors::collect_dns_text(Platform::Linux, runner, dir.string());
  fs::remove_all(test_dir());
  ASSERT_TRUE(dns.rfind("Error getting DNS info: " + dir.string() + ": ", 0) == 0);
  ASSERT_TRUE(runner.calls.empty());
}

TEST(aggregator_survives_unreadable_files) {
  // resolver path and /proc/net/route are both directories
  auto root = test_dir();
  fs::create_directories(root / "proc/net/route");
  fs::create_directories(root / "resolv.d");
  setenv("NETSNAP_PROC_ROOT", root.c_str(), 1);
  FakeRunner runner;
  runner.ok("netstat -rn", "0.0.0.0 192.168.1.1 0.0.0.0 UG 0 0 0 eth0\n");
  runner.ok("arp -n", "Address HWtype HWaddress Flags Mask Iface\n");
  netsnap::app::Aggregator agg(Platform::Linux, runner, (root / "resolv.d").string());
  auto s = agg.collect();
  unsetenv("NETSNAP_PROC_ROOT");
  fs::remove_all(root);

  ASSERT_TRUE(s.routes.ok());
  ASSERT_EQ(s.routes.routes.size(), 1u);
  ASSERT_EQ(s.routes.routes[0].gateway, "192.168.1.1");
  ASSERT_EQ(s.arp, "Address HWtype HWaddress Flags Mask Iface\n");
  ASSERT_TRUE(s.dns.rfind("Error getting DNS info: ", 0) == 0);
  ASSERT_TRUE(s.gateways.empty());

  netsnap::ui::Settings cfg{};
  auto lines = netsnap::ui::render_report(s, cfg);
  ASSERT_TRUE(contains_line(lines, "| 0.0.0.0 "));
  ASSERT_TRUE(contains_line(lines, "No gateway information available"));
  ASSERT_TRUE(contains_line(lines, "Error getting DNS info: "));
}
