#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "broadcaster.hpp"
#include "vm_config.hpp"

namespace hvctl {

/**
 * @brief One guest port and where it can be reached from the host side
 * @details `address` is empty until the guest reports its IP (or, for NAT
 * backends, until the host port is bound).
 */
struct route_map_t {
  std::string port;
  std::string address;
};

struct network_interface_t {
  std::string name;
  std::string ip;
  std::string mask;
  std::string gateway;
  std::vector<route_map_t> udp;
  std::vector<route_map_t> tcp;
  std::vector<route_map_t> http;
  std::vector<route_map_t> https;

  bool has_ports() const {
    return !udp.empty() || !tcp.empty() || !http.empty() || !https.empty();
  }
};

/**
 * @brief One route per configured NIC, named `eth<i>`
 */
std::vector<network_interface_t>
build_routes(const std::vector<network_config_t> &networks);

/**
 * @brief Extract the IPs a guest prints on its console
 * @details
 * A guest announces each DHCP address on a line such as
 * `[1.800000] eth0 ip     : 174.72.0.23`. Lines that mention `ip` and end in
 * an IPv4 address contribute the text after the first ':' (trimmed).
 */
std::vector<std::string> scrape_ips(const std::string &text);

/**
 * @brief Set the address of every port map of route `i` to `ips[i]:port`
 */
void apply_ips(std::vector<network_interface_t> &routes,
               const std::vector<std::string> &ips);

/**
 * @brief Reads console output until an IP line shows up, then keeps reading
 * for `quiet` so that every NIC gets a chance to report
 * @return The scraped IPs, or `std::nullopt` if nothing was found before
 * `timeout` or before the subscription closed
 */
std::optional<std::vector<std::string>>
watch_for_ips(subscription_t &console,
              duration_t quiet = std::chrono::seconds(1),
              duration_t timeout = std::chrono::seconds(30));

} // namespace hvctl

namespace nlohmann {

void to_json(json &j, const hvctl::route_map_t &obj);

void to_json(json &j, const hvctl::network_interface_t &obj);

} // namespace nlohmann
