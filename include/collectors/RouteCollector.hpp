#pragma once
#include "app/CommandRunner.hpp"
#include "model/Route.hpp"
#include "util/Platform.hpp"

namespace netsnap::collectors {

inline constexpr const char* kWindowsRouteCommand = "route print";
inline constexpr const char* kUnixRouteCommand = "netstat -rn";

// Run the platform's route command and parse it. Unsupported platforms get an
// error result without any command being run.
[[nodiscard]] netsnap::model::RouteTable collect_routing_table(netsnap::util::Platform platform,
                                                               netsnap::app::ICommandRunner& runner);

} // namespace netsnap::collectors
