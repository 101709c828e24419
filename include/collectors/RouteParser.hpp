#pragma once
#include "model/Route.hpp"
#include <string_view>
#include <vector>

namespace netsnap::collectors {

// Parse `route print` output. Only lines beginning with "0.0.0.0" qualify;
// columns are destination, netmask, gateway, interface, metric.
[[nodiscard]] std::vector<netsnap::model::RouteRecord> parse_windows_routes(std::string_view text);

// Parse `netstat -rn` output (Linux and BSD layouts). Default-route lines need
// 4 tokens, other dotted-quad lines 5. Interface is always token 5; token 4
// (the refcount/MSS column) is not surfaced.
[[nodiscard]] std::vector<netsnap::model::RouteRecord> parse_unix_routes(std::string_view text);

} // namespace netsnap::collectors
