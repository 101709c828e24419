#pragma once
#include <optional>
#include <string>
#include <vector>

namespace netsnap::model {

struct RouteRecord {
  std::string destination;              // network, "0.0.0.0" or "default"
  std::string gateway;                  // next hop
  std::optional<std::string> mask;      // netmask / genmask
  std::optional<std::string> flags;     // Unix flags, or Windows metric
  std::optional<std::string> interface; // only when the line carried one

  bool operator==(const RouteRecord&) const = default;
};

// Either a parsed route list or an error message, never both.
struct RouteTable {
  std::vector<RouteRecord> routes;
  std::optional<std::string> error;

  [[nodiscard]] bool ok() const { return !error.has_value(); }

  static RouteTable failure(std::string msg) {
    RouteTable t;
    t.error = std::move(msg);
    return t;
  }
};

} // namespace netsnap::model
