#include "config.hpp"

#include <cstdlib>
#include <format>

#include "exception.hpp"

namespace fs = std::filesystem;

namespace hvctl {

static fs::path ensure_directory(const fs::path &path) {
  try {
    fs::create_directories(path);
  } catch (const fs::filesystem_error &e) {
    throw exception(
        std::format("directory creation failed: {}", path.string()));
  }
  return path;
}

fs::path get_vm_drive() {
  if (std::getenv("HVCTL_VM_DRIVE"))
    return ensure_directory(fs::path(std::getenv("HVCTL_VM_DRIVE")));
  return fs::temp_directory_path();
}

fs::path get_kernel_dir() {
  fs::path kernel_dir;
  if (std::getenv("HVCTL_KERNEL_DIR"))
    kernel_dir = fs::path(std::getenv("HVCTL_KERNEL_DIR"));
  else if (std::getenv("HOME"))
    kernel_dir = fs::path(std::getenv("HOME")) / ".hvctl" / "kernels";
  if (kernel_dir.empty())
    throw exception("Cannot get kernel directory");
  return ensure_directory(kernel_dir);
}

std::string get_kernel_url() {
  if (std::getenv("HVCTL_KERNEL_URL"))
    return std::getenv("HVCTL_KERNEL_URL");
  else
    return "https://storage.googleapis.com/vorteil-dl/firecracker-vmlinux";
}

uint16_t get_nethelper_port() {
  const char *env = std::getenv("HVCTL_NETHELPER_PORT");
  if (!env)
    return default_nethelper_port;
  try {
    int port = std::stoi(env);
    if (port <= 0 || port > 65535)
      throw exception<value_error>("config", "HVCTL_NETHELPER_PORT",
                                   "1..65535", env);
    return static_cast<uint16_t>(port);
  } catch (const std::logic_error &) {
    throw exception<value_error>("config", "HVCTL_NETHELPER_PORT", "integer",
                                 env);
  }
}

std::string get_bridge_name() {
  if (std::getenv("HVCTL_BRIDGE"))
    return std::getenv("HVCTL_BRIDGE");
  return default_bridge_name;
}

} // namespace hvctl
