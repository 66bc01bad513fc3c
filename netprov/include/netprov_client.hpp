#pragma once

#include <cstdint>
#include <string>

#include "config.hpp"
#include "netprov.hpp"

namespace hvctl {
namespace netprov {

/**
 * @brief Client side of the provisioning protocol
 * @details Every call throws `exception_t<runtime_error>`: when the helper
 * cannot be reached the message tells the operator to start
 * `hvctl-nethelper`, otherwise it carries the helper's response.
 */
class netprov_client_t {
public:
  explicit netprov_client_t(const std::string &host = "127.0.0.1",
                            uint16_t port = get_nethelper_port());

  /**
   * @return Names of the created devices, in interface order
   */
  devices_t create(const std::string &id, int count) const;

  void remove(const devices_t &devices) const;

  const std::string host;

  const uint16_t port;
};

} // namespace netprov
} // namespace hvctl
