#include "netprov_server.hpp"

#include <format>

#include <httplib.h>

#include "exception.hpp"
#include "logging.hpp"

namespace hvctl {
namespace netprov {

devices_t create_devices(link_manager_t &links, const std::string &bridge,
                         const create_devices_request_t &req) {
  if (req.count < 0)
    throw exception<value_error>("create_devices", "count", "non-negative",
                                 std::to_string(req.count));
  if (req.id.empty())
    throw exception<value_error>("create_devices", "id");
  if (!links.has_link(bridge))
    throw exception(
        std::format("bridge {} not found: no such device", bridge));

  devices_t rv;
  try {
    for (int i = 0; i < req.count; i++) {
      auto name = device_name(req.id, i);
      links.create_tap(name);
      rv.devices.push_back(name);
      links.add_to_bridge(bridge, name);
      links.set_link_up(name);
    }
  } catch (const std::exception &e) {
    for (const auto &name : rv.devices) {
      try {
        links.delete_link(name);
      } catch (const std::exception &rollback_error) {
        warn("failed to remove {}: {}", name, reason_of(rollback_error));
      }
    }
    throw;
  }
  return rv;
}

void delete_devices(link_manager_t &links, const devices_t &req) {
  for (const auto &name : req.devices)
    links.delete_link(name);
}

netprov_server_t::netprov_server_t(std::shared_ptr<link_manager_t> links,
                                   const std::string &bridge)
    : notify_t("netprov"), links_(links), bridge_(bridge),
      server_(std::make_unique<httplib::Server>()) {
  server_->set_pre_routing_handler(
      [](const httplib::Request &req, httplib::Response &res) {
        if (req.method == "POST" || req.method == "DELETE")
          return httplib::Server::HandlerResponse::Unhandled;
        res.status = httplib::BadRequest_400;
        res.set_content("method not available", "text/plain");
        return httplib::Server::HandlerResponse::Handled;
      });

  server_->Post("/", [this](const httplib::Request &req,
                            httplib::Response &res) {
    create_devices_request_t body;
    try {
      body = nlohmann::json::parse(req.body).get<decltype(body)>();
    } catch (const nlohmann::json::exception &e) {
      res.status = httplib::BadRequest_400;
      res.set_content(e.what(), "text/plain");
      return;
    }

    try {
      auto devices = create_devices(*links_, bridge_, body);
      info("created {} device(s) for {}", devices.devices.size(), body.id);
      res.set_content(nlohmann::json(devices).dump(), "application/json");
    } catch (const std::exception &e) {
      error("device creation for {} failed: {}", body.id, reason_of(e));
      res.status = httplib::BadRequest_400;
      res.set_content(reason_of(e), "text/plain");
    }
  });

  server_->Delete("/", [this](const httplib::Request &req,
                              httplib::Response &res) {
    devices_t body;
    try {
      body = nlohmann::json::parse(req.body).get<decltype(body)>();
    } catch (const nlohmann::json::exception &e) {
      res.status = httplib::BadRequest_400;
      res.set_content(e.what(), "text/plain");
      return;
    }

    try {
      delete_devices(*links_, body);
      info("deleted {} device(s)", body.devices.size());
      res.status = httplib::OK_200;
    } catch (const std::exception &e) {
      error("device deletion failed: {}", reason_of(e));
      res.status = httplib::BadRequest_400;
      res.set_content(reason_of(e), "text/plain");
    }
  });
}

netprov_server_t::~netprov_server_t() { stop(); }

uint16_t netprov_server_t::start(const std::string &host, uint16_t port) {
  if (port == 0) {
    int bound = server_->bind_to_any_port(host);
    if (bound < 0)
      throw exception(std::format("cannot bind {}", host));
    port_ = static_cast<uint16_t>(bound);
  } else {
    if (!server_->bind_to_port(host, port))
      throw exception(std::format("cannot bind {}:{}", host, port));
    port_ = port;
  }

  thread_ = std::thread([this] {
    server_->listen_after_bind();
    notify("stopped");
  });
  server_->wait_until_ready();
  info("listening on {}:{} for tap device requests", host, port_);
  return port_;
}

void netprov_server_t::stop() {
  if (server_)
    server_->stop();
  join_or_detach(thread_);
}

} // namespace netprov
} // namespace hvctl
