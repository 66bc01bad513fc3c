#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "backend.hpp"
#include "driver.hpp"
#include "process.hpp"

namespace hvctl {

/**
 * @brief Download callback, receives (bytes so far, total bytes)
 */
using download_progress_t = std::function<void(uint64_t, uint64_t)>;

/**
 * @brief Path of the guest kernel `kernel` in `kernel_dir`, downloading it
 * from `<base_url>/firecracker-<kernel>` if it is not there yet
 * @throw exception_t<runtime_error> if the download fails
 */
std::filesystem::path fetch_kernel(const std::string &kernel,
                                   const std::filesystem::path &kernel_dir,
                                   const std::string &base_url,
                                   download_progress_t progress = nullptr);

/**
 * @brief Machine description passed to `firecracker --config-file`
 */
nlohmann::json
build_firecracker_config(const std::filesystem::path &kernel_path,
                         const std::filesystem::path &disk_path,
                         const vm_spec_t &spec,
                         const std::vector<std::string> &tap_devices);

class firecracker_driver_t : public driver_t {
public:
  std::string type() const override { return "firecracker"; }

  void initialize(const std::string &data) override;

  void setup(operation_t &op, handle_t &handle) override;

  void launch(handle_t &handle) override;

  int wait() override;

  bool is_alive() override;

  /**
   * @brief Sends Ctrl+Alt+Del through the API socket
   */
  void shutdown() override;

  void kill() override;

  void release(handle_t &handle) override;

  std::filesystem::path disk_path() const override { return disk_path_; }

private:
  std::shared_ptr<process_t> current_process() const;

  std::filesystem::path disk_path_;

  std::filesystem::path socket_path_;

  std::filesystem::path config_path_;

  mutable mutex_t m_;

  std::shared_ptr<process_t> process_;

  std::vector<std::string> tap_devices_;
};

class firecracker_backend_t : public backend_t {
public:
  std::string identity() const override { return "firecracker"; }

  /**
   * @details The configuration must be a JSON object; it has no fields yet.
   */
  void validate_config(const std::string &data) const override;

  uint64_t disk_alignment() const override { return 2 * 1024 * 1024; }

  disk_format_t disk_format() const override { return disk_format_t::raw; }

  bool is_available() const override;

  std::shared_ptr<handle_t> allocate() override;
};

} // namespace hvctl
