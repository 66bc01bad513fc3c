/**
 * @file dhcp_server.hpp
 * @brief Minimal DHCPv4 responder for the helper's bridge
 * @details
 *
 * Guests attached to the bridge obtain their address here. Leases are handed
 * out from a fixed range in the bridge's /24; router and DNS server are the
 * bridge address itself.
 */
#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

#include "thread.hpp"

namespace hvctl {
namespace netprov {

/**
 * @brief IPv4 address in host byte order
 */
using ipv4_t = uint32_t;

std::optional<ipv4_t> parse_ipv4(const std::string &s);

std::string format_ipv4(ipv4_t ip);

using mac_t = std::array<uint8_t, 6>;

std::string format_mac(const mac_t &mac);

enum class dhcp_message_type_t : uint8_t {
  discover = 1,
  offer = 2,
  request = 3,
  decline = 4,
  ack = 5,
  nak = 6,
  release = 7,
  inform = 8,
};

enum class dhcp_option_t : uint8_t {
  pad = 0,
  subnet_mask = 1,
  router = 3,
  domain_name_server = 6,
  requested_ip = 50,
  lease_time = 51,
  message_type = 53,
  server_id = 54,
  end = 255,
};

struct dhcp_message_t {
  uint8_t op = 0;
  uint8_t htype = 1;
  uint8_t hlen = 6;
  uint8_t hops = 0;
  uint32_t xid = 0;
  uint16_t secs = 0;
  uint16_t flags = 0;
  ipv4_t ciaddr = 0;
  ipv4_t yiaddr = 0;
  ipv4_t siaddr = 0;
  ipv4_t giaddr = 0;
  std::array<uint8_t, 16> chaddr{};
  std::map<uint8_t, std::string> options;

  mac_t mac() const;

  std::optional<dhcp_message_type_t> message_type() const;

  std::optional<ipv4_t> ipv4_option(dhcp_option_t opt) const;

  void set_option(dhcp_option_t opt, std::string value);

  void set_ipv4_option(dhcp_option_t opt, ipv4_t ip);
};

/**
 * @return `std::nullopt` for anything that is not a well-formed BOOTP/DHCP
 * packet
 */
std::optional<dhcp_message_t> parse_dhcp_message(std::string_view data);

std::string serialize_dhcp_message(const dhcp_message_t &msg);

/**
 * @brief Address leases keyed by hardware address
 * @note Not thread-safe; only the responder thread uses it.
 */
class dhcp_lease_pool_t {
public:
  using clock_t = std::chrono::steady_clock;

  dhcp_lease_pool_t(ipv4_t first, ipv4_t last,
                    std::chrono::seconds lease_duration);

  /**
   * @brief Address to offer to `mac`: its current lease, the `hint` if free,
   * or the lowest free address
   */
  std::optional<ipv4_t> offer(const mac_t &mac,
                              std::optional<ipv4_t> hint = std::nullopt);

  /**
   * @brief Commit `ip` to `mac`
   * @return false if `ip` is out of range or leased to another client
   */
  bool acknowledge(const mac_t &mac, ipv4_t ip);

  void release(const mac_t &mac);

  std::optional<ipv4_t> lease_of(const mac_t &mac) const;

  const std::chrono::seconds lease_duration;

private:
  struct lease_t {
    mac_t mac;
    clock_t::time_point expiry;
  };

  bool is_free(ipv4_t ip, const mac_t &mac) const;

  ipv4_t first_;

  ipv4_t last_;

  std::map<ipv4_t, lease_t> leases_;
};

/**
 * @brief Protocol logic without sockets
 */
class dhcp_handler_t {
public:
  dhcp_handler_t(ipv4_t server, ipv4_t netmask, dhcp_lease_pool_t pool);

  /**
   * @return Reply to send, if any
   */
  std::optional<dhcp_message_t> handle(const dhcp_message_t &req);

  dhcp_lease_pool_t &pool() { return pool_; }

private:
  dhcp_message_t make_reply(const dhcp_message_t &req,
                            dhcp_message_type_t type, ipv4_t yiaddr) const;

  ipv4_t server_;

  ipv4_t netmask_;

  dhcp_lease_pool_t pool_;
};

/**
 * @brief UDP front of `dhcp_handler_t` bound to one interface
 * @details Serves on a background thread until `stop()`. Emits `"error"` to
 * its monitor if the socket fails while serving.
 */
class dhcp_server_t : public notify_t {
public:
  explicit dhcp_server_t(dhcp_handler_t handler);

  ~dhcp_server_t();

  /**
   * @throw exception_t<runtime_error> if the socket cannot be set up
   */
  void start(const std::string &interface, uint16_t port = 67);

  void stop();

private:
  void serve();

  dhcp_handler_t handler_;

  int fd_ = -1;

  uint16_t client_port_ = 68;

  std::atomic_bool running_{false};

  std::thread thread_;
};

/**
 * @brief Handler for the bridge's /24: leases .2 to .254, 2 hour leases
 */
dhcp_handler_t make_bridge_dhcp_handler(const std::string &bridge_address);

} // namespace netprov
} // namespace hvctl
