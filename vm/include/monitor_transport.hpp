#pragma once

#include <filesystem>
#include <memory>
#include <string>

namespace hvctl {

/**
 * @brief Connection to a hypervisor's line-based control socket
 */
class monitor_connection_t {
public:
  explicit monitor_connection_t(int fd) : fd_(fd) {}

  ~monitor_connection_t();

  monitor_connection_t(const monitor_connection_t &) = delete;

  monitor_connection_t &operator=(const monitor_connection_t &) = delete;

  /**
   * @return false if the peer went away
   */
  bool send(const std::string &command);

private:
  int fd_;
};

/**
 * @brief Connect to the monitor socket at `path`
 * @throw exception_t<runtime_error> if nothing listens there
 */
std::unique_ptr<monitor_connection_t>
dial_monitor(const std::filesystem::path &path);

} // namespace hvctl
