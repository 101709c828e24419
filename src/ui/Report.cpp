#include "ui/Report.hpp"
#include "ui/Formatting.hpp"
#include "ui/Table.hpp"
#include "ui/Terminal.hpp"

namespace netsnap::ui {

static void append(std::vector<std::string>& out, const std::vector<std::string>& more) {
  out.insert(out.end(), more.begin(), more.end());
}

std::vector<std::string> render_title(const Settings& cfg) {
  const std::string rule = repeat_str("=", cfg.width);
  return {
    "",
    sgr_bold() + rule + sgr_reset(),
    sgr_bold() + center("NETWORK INFORMATION TOOL", cfg.width) + sgr_reset(),
    sgr_bold() + rule + sgr_reset(),
  };
}

std::vector<std::string> render_section_banner(const std::string& title, const Settings& cfg) {
  const std::string rule = repeat_str("-", cfg.width);
  return {"", rule, sgr_accent() + center(title, cfg.width) + sgr_reset(), rule};
}

std::vector<std::string> render_routes(const netsnap::model::RouteTable& t, const Settings& cfg) {
  auto out = render_section_banner("ROUTING TABLE", cfg);
  if (!t.ok()) {
    out.push_back("");
    out.push_back("Error: " + *t.error);
    return out;
  }
  TextTable table({"Destination", "Gateway", "Netmask", "Interface", "Metric/Flags"}, cfg.unicode);
  for (const auto& r : t.routes) {
    table.add_row({r.destination, r.gateway, r.mask.value_or(""), r.interface.value_or(""), r.flags.value_or("")});
  }
  append(out, table.render());
  return out;
}

std::vector<std::string> render_interfaces(const netsnap::model::InterfaceTable& t, const Settings& cfg) {
  auto out = render_section_banner("NETWORK INTERFACES", cfg);
  if (t.interfaces.empty()) {
    out.push_back("No interface information available");
    if (!t.error.empty()) out.push_back("Error: " + t.error);
    return out;
  }
  TextTable table({"Interface", "IP Address", "Netmask", "MAC Address", "Broadcast"}, cfg.unicode);
  for (const auto& i : t.interfaces) {
    table.add_row({i.name, i.ipv4, i.netmask, i.mac.value_or("N/A"), i.broadcast});
  }
  append(out, table.render());
  return out;
}

std::vector<std::string> render_gateways(const std::vector<netsnap::model::GatewayEntry>& g, const Settings& cfg) {
  auto out = render_section_banner("DEFAULT GATEWAYS", cfg);
  if (g.empty()) {
    out.push_back("No gateway information available");
    return out;
  }
  TextTable table({"Type", "Gateway IP", "Interface"}, cfg.unicode);
  for (const auto& e : g) {
    table.add_row({netsnap::model::family_label(e.family), e.address, e.interface});
  }
  append(out, table.render());
  return out;
}

std::vector<std::string> render_raw_text(const std::string& title, const std::string& text, const Settings& cfg) {
  auto out = render_section_banner(title, cfg);
  out.push_back(text);
  return out;
}

std::vector<std::string> render_report(const netsnap::model::Snapshot& s, const Settings& cfg) {
  std::vector<std::string> out = render_title(cfg);
  append(out, render_routes(s.routes, cfg));
  append(out, render_interfaces(s.interfaces, cfg));
  append(out, render_gateways(s.gateways, cfg));
  append(out, render_raw_text("ARP TABLE", s.arp, cfg));
  append(out, render_raw_text("DNS INFORMATION", s.dns, cfg));
  return out;
}

} // namespace netsnap::ui
