#include <fstream>

#include <httplib.h>

#include "config.hpp"
#include "exception.hpp"
#include "firecracker.hpp"
#include "handle.hpp"
#include "logging.hpp"
#include "netprov_client.hpp"
#include "string_util.hpp"

namespace fs = std::filesystem;

namespace hvctl {

constexpr const char *default_boot_args =
    "console=ttyS0 reboot=k panic=1 pci=off root=/dev/vda rw";

static std::string format_bytes(uint64_t bytes) {
  if (bytes >= 1000 * 1000)
    return std::format("{:.1f} MB", bytes / 1e6);
  if (bytes >= 1000)
    return std::format("{:.1f} kB", bytes / 1e3);
  return std::format("{} B", bytes);
}

nlohmann::json
build_firecracker_config(const fs::path &kernel_path, const fs::path &disk_path,
                         const vm_spec_t &spec,
                         const std::vector<std::string> &tap_devices) {
  nlohmann::json interfaces = nlohmann::json::array();
  for (size_t i = 0; i < tap_devices.size(); i++)
    interfaces.push_back({{"iface_id", std::format("eth{}", i)},
                          {"host_dev_name", tap_devices[i]}});

  nlohmann::json root_drive = {{"drive_id", "1"},
                               {"path_on_host", disk_path.string()},
                               {"is_root_device", true},
                               {"is_read_only", false}};

  return nlohmann::json{
      {"boot-source",
       {{"kernel_image_path", kernel_path.string()},
        {"boot_args",
         spec.kernel_args.empty() ? default_boot_args : spec.kernel_args}}},
      {"drives", nlohmann::json::array({root_drive})},
      {"machine-config",
       {{"vcpu_count", spec.cpus},
        {"mem_size_mib", spec.ram_mib},
        {"smt", false}}},
      {"network-interfaces", interfaces},
  };
}

void firecracker_driver_t::initialize(const std::string &data) {
  auto j = nlohmann::json::parse(data, nullptr, false);
  if (j.is_discarded() || !j.is_object())
    throw exception<value_error>(
        "firecracker configuration must be a JSON object");
}

void firecracker_driver_t::setup(operation_t &op, handle_t &handle) {
  const auto &args = handle.args();
  const auto &spec = args.config.vm;
  if (spec.kernel.empty())
    throw exception<value_error>("VM configuration does not name a kernel");
  if (!fs::exists(args.image_path))
    throw exception<value_error>(std::format(
        "disk image '{}' does not exist", args.image_path.string()));
  disk_path_ = args.image_path;

  op.update_status(std::format("Fetching kernel {} from {}", spec.kernel,
                               args.kernel_dir.string()));
  int last_decile = -1;
  auto kernel_path = fetch_kernel(
      spec.kernel, args.kernel_dir, get_kernel_url(),
      [&](uint64_t current, uint64_t total) {
        int decile = total ? static_cast<int>(current * 10 / total) : 0;
        if (decile == last_decile)
          return;
        last_decile = decile;
        op.update_status(std::format("Downloading kernel ({}/{})",
                                     format_bytes(current),
                                     format_bytes(total)));
      });
  op.log("Kernel: {}", kernel_path.string());

  auto routes = handle.routes();
  std::vector<std::string> devices;
  if (!routes.empty()) {
    op.update_status(
        std::format("Requesting {} tap device(s)", routes.size()));
    netprov::netprov_client_t client;
    devices = client.create(handle.id(), static_cast<int>(routes.size()))
                  .devices;
    {
      wlock_t lk(m_);
      tap_devices_ = devices;
    }
    op.log("Tap devices: {}", utils::join(", ", devices));
  }

  socket_path_ = handle.folder() / std::format("{}.socket", handle.name());
  config_path_ = handle.folder() / "config.json";
  std::ofstream ofs(config_path_);
  ofs << build_firecracker_config(kernel_path, disk_path_, spec, devices)
             .dump(2);
  if (!ofs)
    throw exception<runtime_error>(
        std::format("failed to write {}", config_path_.string()));
}

void firecracker_driver_t::launch(handle_t &handle) {
  std::error_code ec;
  fs::remove(socket_path_, ec);

  auto process = process_t::spawn({"firecracker", "--api-sock",
                                   socket_path_.string(), "--config-file",
                                   config_path_.string()},
                                  handle.console(), handle.folder());
  wlock_t lk(m_);
  process_ = process;
}

int firecracker_driver_t::wait() {
  auto process = current_process();
  if (!process)
    return 0;
  return process->wait();
}

bool firecracker_driver_t::is_alive() {
  auto process = current_process();
  return process && process->is_alive();
}

void firecracker_driver_t::shutdown() {
  httplib::Client client(socket_path_.string());
  client.set_address_family(AF_UNIX);
  client.set_connection_timeout(2, 0);
  client.set_read_timeout(5, 0);

  auto res = client.Put("/actions",
                        nlohmann::json{{"action_type", "SendCtrlAltDel"}}.dump(),
                        "application/json");
  if (!res)
    throw exception<runtime_error>(
        std::format("firecracker API unreachable: {}",
                    httplib::to_string(res.error())));
  if (res->status / 100 != 2)
    throw exception<runtime_error>(std::format(
        "firecracker API returned {}: {}", res->status, res->body));
}

void firecracker_driver_t::kill() {
  if (auto process = current_process())
    process->kill();
}

void firecracker_driver_t::release(handle_t &handle) {
  if (auto process = current_process()) {
    process->kill();
    process->wait();
  }

  std::vector<std::string> devices;
  {
    wlock_t lk(m_);
    process_.reset();
    devices.swap(tap_devices_);
  }
  if (!devices.empty()) {
    netprov::netprov_client_t client;
    client.remove(netprov::devices_t{.devices = devices});
    debug("released tap devices of '{}'", handle.name());
  }
}

std::shared_ptr<process_t> firecracker_driver_t::current_process() const {
  rlock_t lk(m_);
  return process_;
}

} // namespace hvctl
