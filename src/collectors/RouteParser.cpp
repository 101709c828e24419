#include "collectors/RouteParser.hpp"
#include "util/Text.hpp"

#include <utility>

using netsnap::model::RouteRecord;
using netsnap::util::split_lines;
using netsnap::util::split_ws;
using netsnap::util::trim;

namespace netsnap::collectors {

std::vector<RouteRecord> parse_windows_routes(std::string_view text) {
  std::vector<RouteRecord> routes;
  for (auto raw : split_lines(text)) {
    auto line = trim(raw);
    if (!line.starts_with("0.0.0.0")) continue;
    auto parts = split_ws(line);
    if (parts.size() < 5) continue;
    RouteRecord r;
    r.destination = parts[0];
    r.mask = parts[1];
    r.gateway = parts[2];
    r.interface = parts[3];
    r.flags = parts[4];
    routes.push_back(std::move(r));
  }
  return routes;
}

std::vector<RouteRecord> parse_unix_routes(std::string_view text) {
  std::vector<RouteRecord> routes;
  for (auto raw : split_lines(text)) {
    auto line = trim(raw);
    if (line.starts_with("default") || line.starts_with("0.0.0.0")) {
      auto parts = split_ws(line);
      if (parts.size() < 4) continue;
      RouteRecord r;
      r.destination = parts[0];
      r.gateway = parts[1];
      r.mask = parts[2];
      r.flags = parts[3];
      // parts[4] is the MSS/Refs column and is skipped
      if (parts.size() > 5) r.interface = parts[5];
      routes.push_back(std::move(r));
    } else if (netsnap::util::has_dotted_quad_prefix(line)) {
      auto parts = split_ws(line);
      if (parts.size() < 5) continue;
      RouteRecord r;
      r.destination = parts[0];
      r.gateway = parts[1];
      r.mask = parts[2];
      r.flags = parts[3];
      if (parts.size() > 5) r.interface = parts[5];
      routes.push_back(std::move(r));
    }
  }
  return routes;
}

} // namespace netsnap::collectors
