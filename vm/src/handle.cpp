#include "handle.hpp"

#include <format>
#include <fstream>

#include "exception.hpp"
#include "logging.hpp"
#include "string_util.hpp"

namespace hvctl {

handle_t::handle_t(std::shared_ptr<driver_t> driver,
                   const lifecycle_options_t &options)
    : driver_(std::move(driver)), options_(options),
      id_(utils::random_hex(8)), state_(vm_state_t::initializing),
      prepared_(false), created_(std::chrono::system_clock::now()),
      console_(create<broadcaster_t>(console_capacity)) {}

handle_t::~handle_t() {
  join_or_detach(watcher_);
  join_or_detach(scraper_);
}

std::shared_ptr<operation_t> handle_t::prepare(prepare_args_t args) {
  if (state() != vm_state_t::initializing || prepared_.exchange(true))
    throw exception<state_error>("invalid state");

  auto registry = args.registry.lock();
  if (!registry)
    throw exception<runtime_error>("no active registry to prepare into");
  if (!registry->try_insert(args.name, as<handle_t>())) {
    prepared_ = false;
    throw exception<exists_error>("virtual machine already exists");
  }

  args_ = std::move(args);
  folder_ = args_.vm_drive / std::format("{}-{}", type(), id_);
  set_routes(build_routes(args_.config.networks));

  auto op = create<operation_t>();
  op->run([self = as<handle_t>()](operation_t &op) { self->run_prepare(op); });
  return op;
}

void handle_t::run_prepare(operation_t &op) {
  try {
    op.update_status(
        std::format("Preparing {} virtual machine '{}'", type(), name()));
    std::filesystem::create_directories(folder_);
    op.log("Working folder: {}", folder_.string());

    driver_->setup(op, *this);

    auto expected = vm_state_t::initializing;
    if (!state_.compare_exchange_strong(expected, vm_state_t::ready))
      throw exception<state_error>(
          "virtual machine was closed during preparation");
  } catch (const std::exception &e) {
    error("failed to prepare virtual machine '{}': {}", name(), reason_of(e));
    abort_prepare();
    throw;
  }

  info("virtual machine '{}' is ready", name());
  op.update_status("Virtual machine is ready");

  if (args_.start) {
    op.update_status("Starting virtual machine");
    start();
  }
}

void handle_t::abort_prepare() {
  try {
    driver_->release(*this);
  } catch (const std::exception &e) {
    warn("failed to release resources of '{}': {}", name(), reason_of(e));
  }

  std::error_code ec;
  std::filesystem::remove_all(folder_, ec);
  if (ec)
    warn("failed to remove '{}': {}", folder_.string(), ec.message());

  console_->close();
  state_ = vm_state_t::deleted;
  if (auto registry = args_.registry.lock())
    registry->erase(name(), this);
}

void handle_t::start() {
  auto expected = vm_state_t::ready;
  if (!state_.compare_exchange_strong(expected, vm_state_t::changing))
    throw exception<state_error>("invalid state");

  join_threads();

  // Subscribe before launching so that no console output is missed. The
  // snapshot holds the previous boot and is skipped.
  std::shared_ptr<subscription_t> ip_watch;
  if (needs_guest_ips()) {
    ip_watch = console_->subscribe();
    ip_watch->try_recv();
  }

  wlock_t lk(threads_m_);
  ip_watch_ = ip_watch;
  watcher_ = std::thread([self = as<handle_t>(), ip_watch]() {
    self->watch(ip_watch);
  });
}

void handle_t::watch(std::shared_ptr<subscription_t> ip_watch) {
  try {
    driver_->launch(*this);
  } catch (const std::exception &e) {
    error("failed to launch virtual machine '{}': {}", name(), reason_of(e));
    if (ip_watch)
      ip_watch->close();
    auto expected = vm_state_t::changing;
    state_.compare_exchange_strong(expected, vm_state_t::ready);
    return;
  }

  auto expected = vm_state_t::changing;
  if (!state_.compare_exchange_strong(expected, vm_state_t::alive)) {
    // Stopped or closed while booting
    warn("virtual machine '{}' left the changing state during launch",
         name());
    try {
      driver_->kill();
    } catch (const std::exception &e) {
      warn("failed to kill virtual machine '{}': {}", name(), reason_of(e));
    }
    driver_->wait();
    if (ip_watch)
      ip_watch->close();
    return;
  }
  info("virtual machine '{}' is alive", name());

  if (ip_watch) {
    wlock_t lk(threads_m_);
    scraper_ = std::thread([self = as<handle_t>(), ip_watch]() {
      self->scrape(ip_watch);
    });
  }

  int status = driver_->wait();
  if (state() == vm_state_t::alive && status != 0)
    warn("virtual machine '{}' exited unexpectedly with status {}", name(),
         status);
  else
    info("virtual machine '{}' exited with status {}", name(), status);

  if (ip_watch)
    ip_watch->close();

  expected = vm_state_t::alive;
  state_.compare_exchange_strong(expected, vm_state_t::ready);
}

void handle_t::scrape(std::shared_ptr<subscription_t> ip_watch) {
  auto ips = watch_for_ips(*ip_watch, options_.ip_quiet, options_.ip_timeout);
  ip_watch->close();
  if (!ips) {
    warn("virtual machine '{}' did not report an IP address", name());
    return;
  }

  {
    wlock_t lk(routes_m_);
    apply_ips(routes_, *ips);
  }
  info("virtual machine '{}' reported {}", name(), utils::join(", ", *ips));
}

void handle_t::stop() {
  auto current = state();
  switch (current) {
  case vm_state_t::ready:
    throw exception<state_error>("vm is already stopped");
  case vm_state_t::initializing:
  case vm_state_t::deleted:
    throw exception<state_error>("invalid state");
  default:
    break;
  }

  if (current != vm_state_t::broken) {
    state_ = vm_state_t::changing;
    try {
      driver_->shutdown();
    } catch (const std::exception &e) {
      warn("graceful shutdown of '{}' failed: {}", name(), reason_of(e));
    }

    if (poll_until_dead(options_.stop_attempts)) {
      state_ = vm_state_t::ready;
      join_threads();
      info("virtual machine '{}' stopped", name());
      return;
    }

    warn("virtual machine '{}' did not shut down in time, forcing it",
         name());
    state_ = vm_state_t::broken;
  }

  force_stop();
}

void handle_t::force_stop() {
  if (state() != vm_state_t::broken)
    state_ = vm_state_t::changing;

  try {
    driver_->kill();
  } catch (const std::exception &e) {
    warn("failed to kill virtual machine '{}': {}", name(), reason_of(e));
  }

  if (!poll_until_dead(options_.kill_attempts)) {
    state_ = vm_state_t::broken;
    throw exception<state_error>(
        std::format("failed to stop virtual machine '{}'", name()));
  }

  state_ = vm_state_t::ready;
  join_threads();
  info("virtual machine '{}' was forcibly stopped", name());
}

bool handle_t::poll_until_dead(size_t attempts) {
  for (size_t i = 0; i < attempts; i++) {
    if (!driver_->is_alive())
      return true;
    std::this_thread::sleep_for(options_.poll_interval);
  }
  return !driver_->is_alive();
}

void handle_t::close(bool force) {
  auto self = as<handle_t>();
  auto current = state();
  if (current == vm_state_t::deleted)
    return;

  // Setup may still be running on the operation worker. The driver belongs to
  // it until `run_prepare` sees the deleted state and calls `abort_prepare`.
  if (current == vm_state_t::initializing) {
    if (state_.compare_exchange_strong(current, vm_state_t::deleted)) {
      console_->close();
      if (auto registry = args_.registry.lock())
        registry->erase(name(), this);
      info("virtual machine '{}' deleted during preparation", name());
      return;
    }
    if (current == vm_state_t::deleted)
      return;
  }

  std::optional<std::string> first_error;
  auto record = [&](const std::string &what) {
    warn("closing virtual machine '{}': {}", name(), what);
    if (!first_error)
      first_error = what;
  };

  if (current == vm_state_t::alive || current == vm_state_t::changing ||
      current == vm_state_t::broken) {
    try {
      if (force)
        force_stop();
      else
        stop();
    } catch (const std::exception &e) {
      record(reason_of(e));
    }
  }

  try {
    driver_->release(*this);
  } catch (const std::exception &e) {
    record(reason_of(e));
  }

  if (!folder_.empty()) {
    std::error_code ec;
    std::filesystem::remove_all(folder_, ec);
    if (ec)
      record(std::format("failed to remove '{}': {}", folder_.string(),
                         ec.message()));
  }

  console_->close();
  state_ = vm_state_t::deleted;
  join_threads();

  if (auto registry = args_.registry.lock())
    registry->erase(name(), this);
  info("virtual machine '{}' deleted", name());

  if (first_error)
    throw exception<runtime_error>(*first_error);
}

std::unique_ptr<std::istream> handle_t::download_disk() const {
  if (state() != vm_state_t::ready)
    throw exception<state_error>(
        "the machine must be in a stopped or ready state");

  auto path = disk_path();
  auto rv = std::make_unique<std::ifstream>(path, std::ios::binary);
  if (!rv->is_open())
    throw exception<runtime_error>(
        std::format("failed to open disk '{}'", path.string()));
  return rv;
}

vm_details_t handle_t::details() const {
  return vm_details_t{
      .name = name(),
      .virtualizer = virtualizer(),
      .type = type(),
      .state = state(),
      .routes = routes(),
      .created = created_,
      .config = args_.config,
  };
}

std::vector<network_interface_t> handle_t::routes() const {
  rlock_t lk(routes_m_);
  return routes_;
}

void handle_t::set_routes(std::vector<network_interface_t> routes) {
  wlock_t lk(routes_m_);
  routes_ = std::move(routes);
}

bool handle_t::needs_guest_ips() const {
  rlock_t lk(routes_m_);
  for (const auto &route : routes_) {
    for (const auto *maps : {&route.udp, &route.tcp, &route.http, &route.https})
      for (const auto &m : *maps)
        if (m.address.empty())
          return true;
  }
  return false;
}

void handle_t::join_threads() {
  std::thread watcher, scraper;
  {
    wlock_t lk(threads_m_);
    if (ip_watch_) {
      ip_watch_->close();
      ip_watch_.reset();
    }
    watcher = std::move(watcher_);
    scraper = std::move(scraper_);
  }
  join_or_detach(watcher);
  join_or_detach(scraper);
}

} // namespace hvctl

namespace nlohmann {

void to_json(json &j, const hvctl::vm_details_t &obj) {
  j = json{
      {"name", obj.name},
      {"virtualizer", obj.virtualizer},
      {"type", obj.type},
      {"state", hvctl::to_string(obj.state)},
      {"routes", obj.routes},
      {"created",
       std::format("{:%FT%TZ}", std::chrono::floor<std::chrono::seconds>(
                                    obj.created))},
      {"config", obj.config},
  };
}

} // namespace nlohmann
