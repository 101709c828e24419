#include "minitest.hpp"
#include "fake_runner.hpp"
#include "collectors/RouteCollector.hpp"

using netsnap::collectors::collect_routing_table;
using netsnap::util::Platform;

TEST(route_collector_unsupported_platform_runs_nothing) {
  FakeRunner runner;
  runner.ok("netstat -rn", "default 10.0.0.1 UG 0 0 eth0\n");
  runner.ok("route print", "0.0.0.0 0.0.0.0 10.0.0.1 10.0.0.5 25\n");
  auto t = collect_routing_table(Platform::Other, runner);
  ASSERT_FALSE(t.ok());
  ASSERT_EQ(t.error.value_or(""), "Unsupported operating system");
  ASSERT_TRUE(t.routes.empty());
  ASSERT_TRUE(runner.calls.empty());
}

TEST(route_collector_windows_uses_route_print) {
  FakeRunner runner;
  runner.ok("route print", "          0.0.0.0          0.0.0.0      10.0.0.1    10.0.0.5     25\r\n");
  auto t = collect_routing_table(Platform::Windows, runner);
  ASSERT_TRUE(t.ok());
  ASSERT_EQ(runner.calls.size(), 1u);
  ASSERT_EQ(runner.calls[0], "route print");
  ASSERT_EQ(t.routes.size(), 1u);
  ASSERT_EQ(t.routes[0].interface.value_or(""), "10.0.0.5");
}

TEST(route_collector_unix_uses_netstat) {
  for (auto p : {Platform::Linux, Platform::Darwin}) {
    FakeRunner runner;
    runner.ok("netstat -rn", "default 10.0.0.1 0.0.0.0 UG 0 eth0\n10.0.0.0 0.0.0.0 255.0.0.0 U 0 eth0\n");
    auto t = collect_routing_table(p, runner);
    ASSERT_TRUE(t.ok());
    ASSERT_EQ(runner.calls.size(), 1u);
    ASSERT_EQ(runner.calls[0], "netstat -rn");
    ASSERT_EQ(t.routes.size(), 2u);
  }
}

TEST(route_collector_command_failure_becomes_error) {
  FakeRunner runner;
  runner.fail("netstat -rn", "Command 'netstat -rn' returned non-zero exit status 127. sh: 1: netstat: not found");
  auto t = collect_routing_table(Platform::Linux, runner);
  ASSERT_FALSE(t.ok());
  ASSERT_EQ(t.error.value_or(""), "Command 'netstat -rn' returned non-zero exit status 127. sh: 1: netstat: not found");
  ASSERT_TRUE(t.routes.empty());
}

TEST(route_collector_empty_output_is_empty_table) {
  FakeRunner runner;
  runner.ok("netstat -rn", "");
  auto t = collect_routing_table(Platform::Darwin, runner);
  ASSERT_TRUE(t.ok());
  ASSERT_TRUE(t.routes.empty());
}
