/**
 * @file handle.hpp
 * @brief The stateful object representing one VM
 * @details
 *
 * ```
 * initializing --prepare--> ready --start--> changing --> alive
 *                             ^                             |
 *                             +------- changing <--stop-----+
 *                             +------- broken <--(timeout)--+
 * any --close--> deleted
 * ```
 *
 * The state is an atomic, but Start, Stop and Close on the same handle are not
 * serialized against each other; ordering them is up to the caller.
 */
#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <istream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "broadcaster.hpp"
#include "driver.hpp"
#include "network.hpp"
#include "operation.hpp"
#include "registry.hpp"
#include "vm_config.hpp"
#include "vm_state.hpp"

namespace hvctl {

struct lifecycle_options_t {
  /// Interval between two liveness checks while stopping
  duration_t poll_interval = std::chrono::milliseconds(200);
  /// Checks after a graceful shutdown before the VM is considered broken
  size_t stop_attempts = 20;
  /// Checks after a forced stop before giving up
  size_t kill_attempts = 10;
  duration_t ip_quiet = std::chrono::seconds(1);
  duration_t ip_timeout = std::chrono::seconds(30);
};

struct prepare_args_t {
  std::string name;
  /// Catalog entry the VM is created from
  std::string virtualizer;
  vm_config_t config;
  /// Disk image to boot from
  std::filesystem::path image_path;
  bool start = false;
  std::filesystem::path vm_drive;
  std::filesystem::path kernel_dir;
  std::weak_ptr<active_registry_t> registry;
};

struct vm_details_t {
  std::string name;
  std::string virtualizer;
  std::string type;
  vm_state_t state;
  std::vector<network_interface_t> routes;
  std::chrono::system_clock::time_point created;
  vm_config_t config;
};

class handle_t : public object_t {
public:
  static constexpr size_t console_capacity = 2048 * 10;

  handle_t(std::shared_ptr<driver_t> driver,
           const lifecycle_options_t &options = {});

  ~handle_t();

  std::string type() const { return driver_->type(); }

  void initialize(const std::string &data) { driver_->initialize(data); }

  /**
   * @brief Reserve `args.name` and acquire the machine's resources in the
   * background
   * @return The operation tracking the preparation
   * @throw exception_t<exists_error> if a VM with the same name is active
   * @throw exception_t<state_error> unless the handle is `initializing`
   */
  std::shared_ptr<operation_t> prepare(prepare_args_t args);

  /**
   * @throw exception_t<state_error> unless the handle is `ready`
   */
  void start();

  /**
   * @brief Graceful shutdown, escalating to a forced stop on timeout
   * @throw exception_t<state_error> if already stopped, or if the forced stop
   * failed as well (the handle is then `broken`)
   */
  void stop();

  /**
   * @brief Tear the VM down and release its name
   * @details The name is released even if teardown fails; the first teardown
   * error is rethrown afterwards.
   */
  void close(bool force = false);

  vm_state_t state() const { return state_.load(); }

  std::shared_ptr<broadcaster_t> console() const { return console_; }

  /**
   * @brief Open the VM's disk for reading
   * @throw exception_t<state_error> unless the handle is `ready`
   */
  std::unique_ptr<std::istream> download_disk() const;

  vm_details_t details() const;

  const std::string &id() const { return id_; }

  const std::string &name() const { return args_.name; }

  const std::string &virtualizer() const { return args_.virtualizer; }

  const prepare_args_t &args() const { return args_; }

  /**
   * @brief Working folder of this VM, `<vm_drive>/<type>-<id>`
   */
  const std::filesystem::path &folder() const { return folder_; }

  std::filesystem::path disk_path() const { return driver_->disk_path(); }

  std::vector<network_interface_t> routes() const;

  void set_routes(std::vector<network_interface_t> routes);

private:
  void run_prepare(operation_t &op);

  void abort_prepare();

  void watch(std::shared_ptr<subscription_t> ip_watch);

  void scrape(std::shared_ptr<subscription_t> ip_watch);

  /**
   * @brief Kill the machine and wait for it to go down
   */
  void force_stop();

  bool poll_until_dead(size_t attempts);

  bool needs_guest_ips() const;

  void join_threads();

  std::shared_ptr<driver_t> driver_;

  const lifecycle_options_t options_;

  const std::string id_;

  std::atomic<vm_state_t> state_;

  std::atomic_bool prepared_;

  prepare_args_t args_;

  std::filesystem::path folder_;

  std::chrono::system_clock::time_point created_;

  std::shared_ptr<broadcaster_t> console_;

  mutable mutex_t routes_m_;

  std::vector<network_interface_t> routes_;

  mutex_t threads_m_;

  std::thread watcher_;

  std::thread scraper_;

  std::shared_ptr<subscription_t> ip_watch_;
};

} // namespace hvctl

namespace nlohmann {

void to_json(json &j, const hvctl::vm_details_t &obj);

} // namespace nlohmann
