#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace hvctl {

constexpr uint16_t default_nethelper_port = 7476;

constexpr const char *default_bridge_name = "hvctl-bridge";

/**
 * @brief Directory that holds per-VM working folders
 * @details `HVCTL_VM_DRIVE`, or the system temporary directory.
 * The directory is created if it does not exist.
 */
std::filesystem::path get_vm_drive();

/**
 * @brief Directory that holds downloaded guest kernels
 * @details `HVCTL_KERNEL_DIR`, or `~/.hvctl/kernels`.
 * The directory is created if it does not exist.
 */
std::filesystem::path get_kernel_dir();

std::string get_kernel_url();

/**
 * @brief Port of the network helper on the loopback interface
 * @details `HVCTL_NETHELPER_PORT`, or 7476
 */
uint16_t get_nethelper_port();

std::string get_bridge_name();

} // namespace hvctl
