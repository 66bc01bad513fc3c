#include <nlohmann/json.hpp>

#include "exception.hpp"
#include "handle.hpp"
#include "logging.hpp"
#include "qemu.hpp"
#include "string_util.hpp"

namespace fs = std::filesystem;

namespace hvctl {

constexpr size_t monitor_dial_attempts = 10;

constexpr auto monitor_dial_interval = std::chrono::milliseconds(500);

qemu_config_t parse_qemu_config(const std::string &data) {
  auto j = nlohmann::json::parse(data, nullptr, false);
  if (j.is_discarded() || !j.is_object())
    throw exception<value_error>("qemu configuration must be a JSON object");

  qemu_config_t config;
  if (j.contains("headless")) {
    if (!j["headless"].is_boolean())
      throw exception<value_error>("qemu", "headless", "boolean",
                                   j["headless"].dump());
    config.headless = j["headless"].get<bool>();
  }
  return config;
}

std::vector<std::string>
build_qemu_args(const vm_spec_t &spec, const qemu_config_t &config,
                const fs::path &disk_path, const fs::path &folder,
                const std::vector<network_interface_t> &routes) {
  std::vector<std::string> args = {
      "-cpu",    "host",
      "-enable-kvm",
      "-no-reboot",
      "-machine", "q35",
      "-smp",    std::to_string(spec.cpus),
      "-m",      std::to_string(spec.ram_mib),
      "-serial", "stdio",
      "-display", config.headless ? "none" : "gtk",
      "-device", "virtio-scsi-pci,id=scsi",
      "-device", "scsi-hd,drive=hd0",
      "-drive",
      std::format("if=none,file={},format=qcow2,id=hd0", disk_path.string()),
      "-monitor",
      std::format("unix:{},server,nowait", (folder / "monitor.sock").string()),
  };

  bool has_ports = false;
  for (size_t i = 0; i < routes.size(); i++) {
    std::string netdev = std::format("user,id=network{}", i);
    auto forward = [&](const std::vector<route_map_t> &maps,
                       const char *protocol) {
      for (const auto &m : maps) {
        auto host_port = m.address.substr(m.address.rfind(':') + 1);
        netdev += std::format(",hostfwd={}::{}-:{}", protocol, host_port,
                              m.port);
        has_ports = true;
      }
    };
    forward(routes[i].http, "tcp");
    forward(routes[i].https, "tcp");
    forward(routes[i].tcp, "tcp");
    forward(routes[i].udp, "udp");

    args.push_back("-netdev");
    args.push_back(netdev);
    args.push_back("-device");
    args.push_back(std::format(
        "virtio-net-pci,netdev=network{},id=virtio{},mac=26:10:05:00:00:{:02x}",
        i, i, 0xa + i));
  }

  if (!routes.empty() && !has_ports)
    warn("VM has network cards but no defined ports");
  return args;
}

void qemu_driver_t::initialize(const std::string &data) {
  config_ = parse_qemu_config(data);
}

void qemu_driver_t::setup(operation_t &op, handle_t &handle) {
  const auto &args = handle.args();
  if (!fs::exists(args.image_path))
    throw exception<value_error>(std::format(
        "disk image '{}' does not exist", args.image_path.string()));
  disk_path_ = args.image_path;
  monitor_path_ = handle.folder() / "monitor.sock";

  op.update_status("Binding host ports");
  auto routes = handle.routes();
  bind_routes(routes);
  handle.set_routes(routes);

  args_ = build_qemu_args(args.config.vm, config_, disk_path_,
                          handle.folder(), routes);
  op.log("Arguments: {}", utils::join(" ", args_));
}

void qemu_driver_t::launch(handle_t &handle) {
  std::error_code ec;
  fs::remove(monitor_path_, ec);

  std::vector<std::string> argv = {program};
  argv.insert(argv.end(), args_.begin(), args_.end());
  auto process = process_t::spawn(argv, handle.console(), handle.folder());
  {
    wlock_t lk(m_);
    process_ = process;
  }

  std::unique_ptr<monitor_connection_t> monitor;
  std::string last_error;
  for (size_t i = 0; i < monitor_dial_attempts && !monitor; i++) {
    if (!process->is_alive())
      break;
    try {
      monitor = dial_monitor(monitor_path_);
    } catch (const exception_t<runtime_error> &e) {
      last_error = e.reason();
      debug("attempting to dial {}: {}", monitor_path_.string(), last_error);
      std::this_thread::sleep_for(monitor_dial_interval);
    }
  }

  if (!monitor) {
    process->kill();
    int status = process->wait();
    throw exception<runtime_error>(
        last_error.empty()
            ? std::format("qemu exited during launch with status {}", status)
            : std::format("failed to connect to qemu monitor: {}",
                          last_error));
  }

  debug("connected to monitor at {}", monitor_path_.string());
  wlock_t lk(m_);
  monitor_ = std::move(monitor);
}

int qemu_driver_t::wait() {
  auto process = current_process();
  if (!process)
    return 0;
  return process->wait();
}

bool qemu_driver_t::is_alive() {
  auto process = current_process();
  return process && process->is_alive();
}

void qemu_driver_t::shutdown() {
  if (!send_monitor("system_powerdown\n"))
    throw exception<runtime_error>("qemu monitor is not connected");
}

void qemu_driver_t::kill() {
  send_monitor("quit\n");
  if (auto process = current_process())
    process->kill();
}

void qemu_driver_t::release(handle_t &handle) {
  if (auto process = current_process()) {
    process->kill();
    process->wait();
  }
  {
    wlock_t lk(m_);
    monitor_.reset();
    process_.reset();
  }
  if (!monitor_path_.empty()) {
    std::error_code ec;
    fs::remove(monitor_path_, ec);
  }
  debug("released qemu resources of '{}'", handle.name());
}

std::shared_ptr<process_t> qemu_driver_t::current_process() const {
  rlock_t lk(m_);
  return process_;
}

bool qemu_driver_t::send_monitor(const std::string &command) {
  wlock_t lk(m_);
  if (!monitor_)
    return false;
  if (!monitor_->send(command)) {
    monitor_.reset();
    return false;
  }
  return true;
}

} // namespace hvctl
