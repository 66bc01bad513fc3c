#pragma once

#include <memory>
#include <string>

#include "object.hpp"

namespace hvctl {
namespace netprov {

/**
 * @brief Host network links the helper creates and deletes
 * @details Failures throw `exception_t<runtime_error>` carrying the system
 * message.
 */
class link_manager_t : public object_t {
public:
  virtual bool has_link(const std::string &name) = 0;

  /**
   * @brief Create a bridge device
   * @note Succeeds if the bridge already exists
   */
  virtual void create_bridge(const std::string &name) = 0;

  /**
   * @brief Assign an IPv4 address to a link
   * @param address Dotted quad
   * @param prefix_length Netmask as prefix length
   * @note Succeeds if the address is already assigned
   */
  virtual void set_address(const std::string &name, const std::string &address,
                           int prefix_length) = 0;

  /**
   * @brief Create a persistent tap device
   */
  virtual void create_tap(const std::string &name) = 0;

  virtual void set_link_up(const std::string &name) = 0;

  virtual void add_to_bridge(const std::string &bridge,
                             const std::string &name) = 0;

  /**
   * @brief Delete a tap device
   * @note Does nothing if the link does not exist
   */
  virtual void delete_link(const std::string &name) = 0;
};

/**
 * @brief Link manager backed by the kernel (ioctl on /dev/net/tun and
 * AF_INET sockets). Requires CAP_NET_ADMIN.
 */
std::shared_ptr<link_manager_t> create_system_link_manager();

} // namespace netprov
} // namespace hvctl
