#pragma once

#include "model/Snapshot.hpp"
#include "ui/Config.hpp"
#include <string>
#include <vector>

namespace netsnap::ui {

// Every renderer returns output lines without trailing '\n'. Raw text
// sections come back as one element holding the text verbatim.

std::vector<std::string> render_title(const Settings& cfg);
std::vector<std::string> render_section_banner(const std::string& title, const Settings& cfg);

std::vector<std::string> render_routes(const netsnap::model::RouteTable& t, const Settings& cfg);
std::vector<std::string> render_interfaces(const netsnap::model::InterfaceTable& t, const Settings& cfg);
std::vector<std::string> render_gateways(const std::vector<netsnap::model::GatewayEntry>& g, const Settings& cfg);
std::vector<std::string> render_raw_text(const std::string& title, const std::string& text, const Settings& cfg);

// Title, then routing table, interfaces, gateways, ARP, DNS.
std::vector<std::string> render_report(const netsnap::model::Snapshot& s, const Settings& cfg);

} // namespace netsnap::ui
