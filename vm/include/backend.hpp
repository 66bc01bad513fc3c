#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "handle.hpp"
#include "vm_state.hpp"

namespace hvctl {

/**
 * @brief One hypervisor implementation
 * @details Registered with `manager_t` under `identity()`. Catalog entries
 * whose type equals the identity are served by this backend.
 */
class backend_t : public object_t {
public:
  virtual std::string identity() const = 0;

  /**
   * @throw exception_t<value_error> if `data` is not usable on this host
   */
  virtual void validate_config(const std::string &data) const = 0;

  /**
   * @brief Disk sizes must be a multiple of this many bytes
   */
  virtual uint64_t disk_alignment() const = 0;

  virtual disk_format_t disk_format() const = 0;

  /**
   * @return true if the hypervisor can run on this host
   */
  virtual bool is_available() const = 0;

  virtual std::shared_ptr<handle_t> allocate() = 0;
};

} // namespace hvctl
