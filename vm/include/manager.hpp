/**
 * @file manager.hpp
 * @brief Entry point of the library
 * @details
 *
 * `manager_t` correlates two key spaces:
 *
 * - the catalog: virtualizer name -> backend type + backend configuration
 * - the active registry: VM name -> live `handle_t`
 *
 * ```cpp
 * auto manager = hvctl::create<hvctl::manager_t>(
 *     hvctl::create<hvctl::sqlite_catalog_t>("hvctl.db"));
 * hvctl::register_builtin_backends(*manager);
 * manager->create_virtualizer("fc", "firecracker", "{}");
 *
 * hvctl::prepare_args_t args{.name = "vm1", .image_path = "disk.raw"};
 * auto op = manager->prepare("fc", args);
 * if (auto err = op->wait())
 *   hvctl::error("{}", *err);
 * manager->find("vm1")->start();
 * ```
 */
#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "backend.hpp"
#include "catalog.hpp"
#include "registry.hpp"

namespace hvctl {

struct manager_options_t {
  /// Defaults to `get_vm_drive()` when empty
  std::filesystem::path vm_drive;
  /// Defaults to `get_kernel_dir()` when empty
  std::filesystem::path kernel_dir;
};

class manager_t : public object_t {
public:
  manager_t(std::shared_ptr<catalog_t> catalog,
            const manager_options_t &options = {});

  ~manager_t();

  /**
   * @throw exception_t<exists_error> if a backend with the same identity is
   * registered
   */
  void register_backend(std::shared_ptr<backend_t> backend);

  std::vector<std::shared_ptr<backend_t>> backends() const;

  /**
   * @brief Registered backends that can run on this host
   */
  std::vector<std::shared_ptr<backend_t>> installed_backends() const;

  std::shared_ptr<backend_t> find_backend(const std::string &type) const;

  /**
   * @throw exception_t<value_error> if `type` is unknown or `data` invalid
   * @throw exception_t<exists_error> if `name` is taken
   */
  void create_virtualizer(const std::string &name, const std::string &type,
                          const std::string &data);

  void delete_virtualizer(const std::string &name);

  std::vector<catalog_entry_t> list() const;

  disk_format_t disk_format(const std::string &name) const;

  uint64_t disk_alignment(const std::string &name) const;

  /**
   * @brief Validate the stored configuration against its backend
   */
  void validate_args(const std::string &name) const;

  /**
   * @return The stored backend configuration
   */
  std::string return_data(const std::string &name) const;

  /**
   * @brief Start preparing a VM from the virtualizer `virtualizer`
   * @throw exception_t<exists_error> if `args.name` is active
   */
  std::shared_ptr<operation_t> prepare(const std::string &virtualizer,
                                       prepare_args_t args);

  std::shared_ptr<handle_t> find(const std::string &vm_name) const;

  std::vector<std::shared_ptr<handle_t>> active() const;

  /**
   * @brief Force-close every active VM
   * @return Number of VMs that failed to close cleanly
   */
  size_t close();

  std::shared_ptr<active_registry_t> registry() const { return registry_; }

private:
  catalog_entry_t lookup(const std::string &name) const;

  std::shared_ptr<backend_t> backend_of(const catalog_entry_t &entry) const;

  std::shared_ptr<catalog_t> catalog_;

  std::shared_ptr<active_registry_t> registry_;

  manager_options_t options_;

  mutable mutex_t m_;

  std::map<std::string, std::shared_ptr<backend_t>> backends_;
};

/**
 * @brief Register the firecracker and qemu backends
 */
void register_builtin_backends(manager_t &manager);

} // namespace hvctl
