#include "manager.hpp"

#include "config.hpp"
#include "exception.hpp"
#include "firecracker/firecracker.hpp"
#include "logging.hpp"
#include "qemu/qemu.hpp"

namespace hvctl {

manager_t::manager_t(std::shared_ptr<catalog_t> catalog,
                     const manager_options_t &options)
    : catalog_(std::move(catalog)),
      registry_(create<active_registry_t>()), options_(options) {
  if (options_.vm_drive.empty())
    options_.vm_drive = get_vm_drive();
  if (options_.kernel_dir.empty())
    options_.kernel_dir = get_kernel_dir();
}

manager_t::~manager_t() {
  if (size_t failures = close())
    warn("{} virtual machine(s) failed to close cleanly", failures);
}

void manager_t::register_backend(std::shared_ptr<backend_t> backend) {
  wlock_t lk(m_);
  auto identity = backend->identity();
  if (!backends_.emplace(identity, std::move(backend)).second)
    throw exception<exists_error>(
        std::format("backend '{}' is already registered", identity));
  debug("backend '{}' registered", identity);
}

std::vector<std::shared_ptr<backend_t>> manager_t::backends() const {
  rlock_t lk(m_);
  std::vector<std::shared_ptr<backend_t>> rv;
  for (const auto &[identity, backend] : backends_)
    rv.push_back(backend);
  return rv;
}

std::vector<std::shared_ptr<backend_t>> manager_t::installed_backends() const {
  std::vector<std::shared_ptr<backend_t>> rv;
  for (auto &backend : backends())
    if (backend->is_available())
      rv.push_back(backend);
  return rv;
}

std::shared_ptr<backend_t>
manager_t::find_backend(const std::string &type) const {
  rlock_t lk(m_);
  auto it = backends_.find(type);
  if (it == backends_.end())
    return nullptr;
  return it->second;
}

void manager_t::create_virtualizer(const std::string &name,
                                   const std::string &type,
                                   const std::string &data) {
  auto backend = find_backend(type);
  if (!backend)
    throw exception<value_error>(
        std::format("unrecognized virtualizer type: {}", type));

  backend->validate_config(data);

  if (!catalog_->insert(
          catalog_entry_t{.name = name, .type = type, .data = data}))
    throw exception<exists_error>(
        std::format("virtualizer named '{}' already exists", name));
  info("virtualizer '{}' ({}) created", name, type);
}

void manager_t::delete_virtualizer(const std::string &name) {
  if (!catalog_->remove(name))
    throw exception<not_found_error>(
        std::format("no virtualizer named '{}'", name));
  info("virtualizer '{}' deleted", name);
}

std::vector<catalog_entry_t> manager_t::list() const {
  return catalog_->list();
}

disk_format_t manager_t::disk_format(const std::string &name) const {
  return backend_of(lookup(name))->disk_format();
}

uint64_t manager_t::disk_alignment(const std::string &name) const {
  return backend_of(lookup(name))->disk_alignment();
}

void manager_t::validate_args(const std::string &name) const {
  auto entry = lookup(name);
  backend_of(entry)->validate_config(entry.data);
}

std::string manager_t::return_data(const std::string &name) const {
  return lookup(name).data;
}

std::shared_ptr<operation_t> manager_t::prepare(const std::string &virtualizer,
                                                prepare_args_t args) {
  auto entry = lookup(virtualizer);
  auto handle = backend_of(entry)->allocate();

  try {
    handle->initialize(entry.data);
  } catch (const std::exception &e) {
    throw exception<value_error>(
        std::format("failed to initialize virtualizer '{}': {}", virtualizer,
                    reason_of(e)));
  }

  args.virtualizer = virtualizer;
  args.vm_drive = options_.vm_drive;
  args.kernel_dir = options_.kernel_dir;
  args.registry = registry_;
  return handle->prepare(std::move(args));
}

std::shared_ptr<handle_t> manager_t::find(const std::string &vm_name) const {
  return registry_->find(vm_name);
}

std::vector<std::shared_ptr<handle_t>> manager_t::active() const {
  return registry_->snapshot();
}

size_t manager_t::close() {
  size_t failures = 0;
  for (auto &handle : registry_->snapshot()) {
    try {
      handle->close(true);
    } catch (const std::exception &e) {
      error("failed to close virtual machine '{}': {}", handle->name(),
            reason_of(e));
      failures++;
    }
  }
  return failures;
}

catalog_entry_t manager_t::lookup(const std::string &name) const {
  auto entry = catalog_->find(name);
  if (!entry)
    throw exception<not_found_error>(
        std::format("no virtualizer named '{}'", name));
  return *entry;
}

std::shared_ptr<backend_t>
manager_t::backend_of(const catalog_entry_t &entry) const {
  auto backend = find_backend(entry.type);
  if (!backend)
    throw exception<value_error>(
        std::format("virtualizer '{}' has unrecognized virtualizer type: {}",
                    entry.name, entry.type));
  return backend;
}

void register_builtin_backends(manager_t &manager) {
  manager.register_backend(create<firecracker_backend_t>());
  manager.register_backend(create<qemu_backend_t>());
}

} // namespace hvctl
