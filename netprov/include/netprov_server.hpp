#pragma once

#include <memory>
#include <string>
#include <thread>

#include "link_manager.hpp"
#include "netprov.hpp"
#include "thread.hpp"

namespace httplib {
class Server;
}

namespace hvctl {
namespace netprov {

/**
 * @brief Create `req.count` tap devices attached to `bridge`
 * @details For each index in order: create a persistent tap, attach it to the
 * bridge and set it up. On failure the devices created so far are deleted
 * again before the error propagates.
 * @return Device names `id-0` .. `id-(count-1)`
 */
devices_t create_devices(link_manager_t &links, const std::string &bridge,
                         const create_devices_request_t &req);

/**
 * @brief Delete devices. Missing devices are ignored.
 */
void delete_devices(link_manager_t &links, const devices_t &req);

/**
 * @brief HTTP front of the provisioning protocol
 * @details
 * `start()` binds synchronously and serves on a background thread. When the
 * serving loop ends the server emits `"stopped"` to its monitor.
 */
class netprov_server_t : public notify_t {
public:
  netprov_server_t(std::shared_ptr<link_manager_t> links,
                   const std::string &bridge);

  ~netprov_server_t();

  /**
   * @param port 0 binds an ephemeral port
   * @return Bound port
   * @throw exception_t<runtime_error> if the address cannot be bound
   */
  uint16_t start(const std::string &host, uint16_t port);

  void stop();

  uint16_t port() const { return port_; }

private:
  std::shared_ptr<link_manager_t> links_;

  std::string bridge_;

  std::unique_ptr<httplib::Server> server_;

  std::thread thread_;

  uint16_t port_ = 0;
};

} // namespace netprov
} // namespace hvctl
