#pragma once

#include <string>

#include <magic_enum/magic_enum.hpp>

namespace hvctl {

/**
 * @brief Lifecycle state of one VM. Never persisted.
 */
enum class vm_state_t {
  initializing,
  ready,
  changing,
  alive,
  broken,
  deleted,
};

/**
 * @brief Disk image format a backend boots from
 */
enum class disk_format_t {
  raw,
  qcow2,
  vmdk,
  vhd,
};

template <typename enum_t>
  requires std::is_enum_v<enum_t>
std::string to_string(enum_t value) {
  return std::string(magic_enum::enum_name(value));
}

} // namespace hvctl
