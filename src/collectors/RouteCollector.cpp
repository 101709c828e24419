#include "collectors/RouteCollector.hpp"
#include "collectors/RouteParser.hpp"
#include "util/Diag.hpp"

using netsnap::model::RouteTable;
using netsnap::util::Platform;

namespace netsnap::collectors {

RouteTable collect_routing_table(Platform platform, netsnap::app::ICommandRunner& runner) {
  const char* command = nullptr;
  switch (platform) {
    case Platform::Windows: command = kWindowsRouteCommand; break;
    case Platform::Linux:
    case Platform::Darwin:  command = kUnixRouteCommand; break;
    case Platform::Other:
      netsnap::util::diag("RouteCollector", "no route command for this platform");
      return RouteTable::failure("Unsupported operating system");
  }

  auto res = runner.run(command);
  if (!res.ok) {
    netsnap::util::diag("RouteCollector", res.error);
    return RouteTable::failure(res.error);
  }

  RouteTable table;
  table.routes = platform == Platform::Windows ? parse_windows_routes(res.output)
                                               : parse_unix_routes(res.output);
  netsnap::util::diag("RouteCollector", std::to_string(table.routes.size()) + " routes parsed");
  return table;
}

} // namespace netsnap::collectors
