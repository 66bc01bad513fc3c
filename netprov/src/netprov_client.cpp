#include "netprov_client.hpp"

#include <format>

#include <httplib.h>

#include "exception.hpp"
#include "logging.hpp"

namespace hvctl {
namespace netprov {

static httplib::Client make_client(const std::string &host, uint16_t port) {
  httplib::Client client(host, port);
  client.set_connection_timeout(5, 0);
  client.set_read_timeout(30, 0);
  client.set_write_timeout(5, 0);
  return client;
}

static std::string unreachable(const std::string &host, uint16_t port,
                               httplib::Error err) {
  return std::format("network helper is not reachable at {}:{} ({}); run "
                     "'sudo hvctl-nethelper' before using this backend",
                     host, port, httplib::to_string(err));
}

netprov_client_t::netprov_client_t(const std::string &host, uint16_t port)
    : host(host), port(port) {}

devices_t netprov_client_t::create(const std::string &id, int count) const {
  auto client = make_client(host, port);
  auto body = nlohmann::json(create_devices_request_t{.id = id, .count = count});
  auto res = client.Post("/", body.dump(), "application/json");
  if (!res)
    throw exception(unreachable(host, port, res.error()));
  if (res->status != httplib::OK_200)
    throw exception(std::format("network helper refused to create devices "
                                "for {}: HTTP {} {}",
                                id, res->status, res->body));

  try {
    auto devices = nlohmann::json::parse(res->body).get<devices_t>();
    if (devices.devices.size() != static_cast<size_t>(count))
      throw exception(std::format("network helper returned {} device(s) for "
                                  "{}, expected {}",
                                  devices.devices.size(), id, count));
    debug("network helper created [{}]", res->body);
    return devices;
  } catch (const nlohmann::json::exception &e) {
    throw exception(
        std::format("malformed network helper response: {}", e.what()));
  }
}

void netprov_client_t::remove(const devices_t &devices) const {
  if (devices.devices.empty())
    return;
  auto client = make_client(host, port);
  auto body = nlohmann::json(devices);
  auto res = client.Delete("/", body.dump(), "application/json");
  if (!res)
    throw exception(unreachable(host, port, res.error()));
  if (res->status != httplib::OK_200)
    throw exception(std::format("network helper refused to delete devices: "
                                "HTTP {} {}",
                                res->status, res->body));
}

} // namespace netprov
} // namespace hvctl
