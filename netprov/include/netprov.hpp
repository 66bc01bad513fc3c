/**
 * @file netprov.hpp
 * @brief Tap device provisioning protocol
 * @details
 *
 * Creating tap devices and attaching them to the bridge needs privileges the
 * VM manager usually does not have. `hvctl-nethelper` runs with those
 * privileges, owns the bridge and its DHCP responder, and serves a small HTTP
 * protocol on the loopback interface:
 *
 * | Method   | Body                        | Response                     |
 * |----------|-----------------------------|------------------------------|
 * | `POST`   | `{"id": s, "count": n}`     | `{"devices": ["s-0", ...]}`  |
 * | `DELETE` | `{"devices": [...]}`        | 200, missing devices ignored |
 * | other    |                             | 400 `method not available`   |
 */
#pragma once

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace hvctl {
namespace netprov {

constexpr const char *bridge_address = "174.72.0.1";

constexpr int bridge_prefix_length = 24;

struct create_devices_request_t {
  std::string id;
  int count = 0;
};

struct devices_t {
  std::vector<std::string> devices;
};

/**
 * @brief Name of the `index`-th device of `id`
 */
std::string device_name(const std::string &id, int index);

} // namespace netprov
} // namespace hvctl

namespace nlohmann {

void to_json(json &j, const hvctl::netprov::create_devices_request_t &obj);

void from_json(const json &j, hvctl::netprov::create_devices_request_t &obj);

void to_json(json &j, const hvctl::netprov::devices_t &obj);

void from_json(const json &j, hvctl::netprov::devices_t &obj);

} // namespace nlohmann
