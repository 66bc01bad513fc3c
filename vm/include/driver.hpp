#pragma once

#include <filesystem>
#include <string>

#include "object.hpp"

namespace hvctl {

class handle_t;
class operation_t;

/**
 * @brief The per-backend part of a VM's lifecycle
 * @details
 * `handle_t` implements the state machine once and calls into a driver for
 * everything that depends on the hypervisor. A driver owns the backend-private
 * resources of one VM (process, sockets, network devices).
 *
 * Calls arrive in this order: `initialize`, `setup`, then any number of
 * `launch` / `wait` cycles, then `release`. `shutdown`, `kill` and
 * `is_alive` may be called from another thread while `wait` is blocked.
 */
class driver_t : public object_t {
public:
  virtual std::string type() const = 0;

  /**
   * @brief Apply the opaque backend configuration stored in the catalog
   * @throw exception_t<value_error> if `data` is malformed
   */
  virtual void initialize(const std::string &data) = 0;

  /**
   * @brief Acquire everything the machine needs to boot
   * @details Runs on the preparation worker. Progress goes to `op`.
   */
  virtual void setup(operation_t &op, handle_t &handle) = 0;

  /**
   * @brief Boot the machine. Returns once the hypervisor confirmed it.
   */
  virtual void launch(handle_t &handle) = 0;

  /**
   * @brief Blocks until the machine launched last exits
   * @return Exit status of the hypervisor, 0 on a clean exit
   */
  virtual int wait() = 0;

  virtual bool is_alive() = 0;

  /**
   * @brief Ask the guest to power off
   */
  virtual void shutdown() = 0;

  virtual void kill() = 0;

  /**
   * @brief Drop every resource acquired by `setup` and `launch`
   * @details Must be safe to call after a partial `setup`.
   */
  virtual void release(handle_t &handle) = 0;

  virtual std::filesystem::path disk_path() const = 0;
};

} // namespace hvctl
