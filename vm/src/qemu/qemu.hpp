#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

#include "backend.hpp"
#include "driver.hpp"
#include "monitor_transport.hpp"
#include "process.hpp"

namespace hvctl {

struct qemu_config_t {
  bool headless = false;
};

/**
 * @throw exception_t<value_error> if `data` is not a valid qemu configuration
 */
qemu_config_t parse_qemu_config(const std::string &data);

/**
 * @brief Reserve a host port to forward to guest port `port`
 * @details Tries the same port number first and falls back to an ephemeral
 * port when it is taken.
 * @param protocol "tcp" or "udp"
 * @return The host port
 */
uint16_t bind_port(const std::string &protocol, const std::string &port);

/**
 * @brief Bind a host port for every port map and set its address to
 * `localhost:<host port>`
 */
void bind_routes(std::vector<network_interface_t> &routes);

/**
 * @brief `qemu-system-x86_64` arguments, without the program name
 * @details `routes` must already be bound, see `bind_routes`.
 */
std::vector<std::string>
build_qemu_args(const vm_spec_t &spec, const qemu_config_t &config,
                const std::filesystem::path &disk_path,
                const std::filesystem::path &folder,
                const std::vector<network_interface_t> &routes);

class qemu_driver_t : public driver_t {
public:
  static constexpr const char *program = "qemu-system-x86_64";

  std::string type() const override { return "qemu"; }

  void initialize(const std::string &data) override;

  void setup(operation_t &op, handle_t &handle) override;

  /**
   * @details Returns once the monitor socket accepted a connection.
   */
  void launch(handle_t &handle) override;

  int wait() override;

  bool is_alive() override;

  /**
   * @brief Sends `system_powerdown` to the monitor
   */
  void shutdown() override;

  void kill() override;

  void release(handle_t &handle) override;

  std::filesystem::path disk_path() const override { return disk_path_; }

private:
  std::shared_ptr<process_t> current_process() const;

  bool send_monitor(const std::string &command);

  qemu_config_t config_;

  std::filesystem::path disk_path_;

  std::filesystem::path monitor_path_;

  std::vector<std::string> args_;

  mutable mutex_t m_;

  std::shared_ptr<process_t> process_;

  std::unique_ptr<monitor_connection_t> monitor_;
};

class qemu_backend_t : public backend_t {
public:
  std::string identity() const override { return "qemu"; }

  void validate_config(const std::string &data) const override {
    parse_qemu_config(data);
  }

  uint64_t disk_alignment() const override { return 2 * 1024 * 1024; }

  disk_format_t disk_format() const override { return disk_format_t::qcow2; }

  bool is_available() const override {
    return find_in_path(qemu_driver_t::program);
  }

  std::shared_ptr<handle_t> allocate() override {
    return create<handle_t>(create<qemu_driver_t>());
  }
};

} // namespace hvctl
