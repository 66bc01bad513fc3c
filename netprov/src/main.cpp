#include <csignal>

#include "config.hpp"
#include "dhcp_server.hpp"
#include "exception.hpp"
#include "logging.hpp"
#include "netprov_server.hpp"

using namespace std::chrono_literals;

int main() {
  std::signal(SIGINT, hvctl::stop_t::signal_handler);
  std::signal(SIGTERM, hvctl::stop_t::signal_handler);

  int rv = 0;
  try {
    auto links = hvctl::netprov::create_system_link_manager();
    auto bridge = hvctl::get_bridge_name();

    hvctl::info("creating bridge {}", bridge);
    links->create_bridge(bridge);
    links->set_link_up(bridge);
    links->set_address(bridge, hvctl::netprov::bridge_address,
                       hvctl::netprov::bridge_prefix_length);

    auto monitor = hvctl::create<hvctl::monitor_t>();
    hvctl::stop_t::global_stop.set_monitor(monitor);

    auto dhcp = hvctl::create<hvctl::netprov::dhcp_server_t>(
        hvctl::netprov::make_bridge_dhcp_handler(
            hvctl::netprov::bridge_address));
    dhcp->set_monitor(monitor);
    dhcp->start(bridge);

    auto server = hvctl::create<hvctl::netprov::netprov_server_t>(links, bridge);
    server->set_monitor(monitor);
    server->start("127.0.0.1", hvctl::get_nethelper_port());

    while (!hvctl::stop_t::global_stop) {
      auto signal_opt = monitor->monitor(100ms);
      if (!signal_opt.has_value())
        continue;
      auto signal = signal_opt.value();
      if (signal.what == "stop")
        break;
      hvctl::error("{} {}, shutting down", signal.who, signal.what);
      rv = 1;
      break;
    }

    server->stop();
    dhcp->stop();
    hvctl::info("network helper stopped");
  } catch (const std::exception &e) {
    hvctl::critical(e.what());
    return 1;
  }
  return rv;
}
