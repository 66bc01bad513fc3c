#include "network.hpp"

#include <algorithm>
#include <format>
#include <regex>

#include "string_util.hpp"

namespace hvctl {

static std::vector<route_map_t>
to_route_maps(const std::vector<std::string> &ports) {
  std::vector<route_map_t> rv;
  rv.reserve(ports.size());
  for (const auto &port : ports)
    rv.push_back(route_map_t{.port = port, .address = ""});
  return rv;
}

std::vector<network_interface_t>
build_routes(const std::vector<network_config_t> &networks) {
  std::vector<network_interface_t> routes;
  routes.reserve(networks.size());
  for (size_t i = 0; i < networks.size(); i++) {
    const auto &nc = networks[i];
    routes.push_back(network_interface_t{
        .name = std::format("eth{}", i),
        .ip = nc.ip,
        .mask = nc.mask,
        .gateway = nc.gateway,
        .udp = to_route_maps(nc.udp),
        .tcp = to_route_maps(nc.tcp),
        .http = to_route_maps(nc.http),
        .https = to_route_maps(nc.https),
    });
  }
  return routes;
}

std::vector<std::string> scrape_ips(const std::string &text) {
  static const std::regex ip_at_eol(
      R"((?:[0-9]{1,3}\.){3}[0-9]{1,3}\s*$)");

  std::vector<std::string> ips;
  for (auto line : utils::split_text(text, "\n")) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.find("ip") == std::string::npos)
      continue;
    if (!std::regex_search(line, ip_at_eol))
      continue;
    auto parts = utils::split_text(line, ":");
    if (parts.size() < 2)
      continue;
    ips.push_back(utils::trim(parts[1]));
  }
  return ips;
}

void apply_ips(std::vector<network_interface_t> &routes,
               const std::vector<std::string> &ips) {
  auto fill = [](std::vector<route_map_t> &maps, const std::string &ip) {
    for (auto &m : maps)
      m.address = std::format("{}:{}", ip, m.port);
  };
  for (size_t i = 0; i < routes.size() && i < ips.size(); i++) {
    routes[i].ip = ips[i];
    fill(routes[i].udp, ips[i]);
    fill(routes[i].tcp, ips[i]);
    fill(routes[i].http, ips[i]);
    fill(routes[i].https, ips[i]);
  }
}

std::optional<std::vector<std::string>>
watch_for_ips(subscription_t &console, duration_t quiet, duration_t timeout) {
  std::string text;
  const auto deadline = now() + timeout;
  std::optional<time_point_t> settle;

  while (true) {
    auto due = settle ? std::min(*settle, deadline) : deadline;
    if (now() >= due)
      break;
    auto chunk = console.recv_for(due - now());
    if (chunk) {
      text += *chunk;
      if (!settle && text.find("ip") != std::string::npos &&
          !scrape_ips(text).empty())
        settle = now() + quiet;
      continue;
    }
    if (console.is_closed())
      break;
  }

  auto ips = scrape_ips(text);
  if (ips.empty())
    return std::nullopt;
  return ips;
}

} // namespace hvctl

namespace nlohmann {

void to_json(json &j, const hvctl::route_map_t &obj) {
  j = json{{"port", obj.port}, {"address", obj.address}};
}

void to_json(json &j, const hvctl::network_interface_t &obj) {
  j = json{{"name", obj.name},       {"ip", obj.ip},
           {"mask", obj.mask},       {"gateway", obj.gateway},
           {"udp", obj.udp},         {"tcp", obj.tcp},
           {"http", obj.http},       {"https", obj.https}};
}

} // namespace nlohmann
