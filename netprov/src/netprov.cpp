#include "netprov.hpp"

#include <format>

namespace hvctl {
namespace netprov {

std::string device_name(const std::string &id, int index) {
  return std::format("{}-{}", id, index);
}

} // namespace netprov
} // namespace hvctl

namespace nlohmann {

void to_json(json &j, const hvctl::netprov::create_devices_request_t &obj) {
  j = json{{"id", obj.id}, {"count", obj.count}};
}

void from_json(const json &j, hvctl::netprov::create_devices_request_t &obj) {
  j.at("id").get_to(obj.id);
  j.at("count").get_to(obj.count);
}

void to_json(json &j, const hvctl::netprov::devices_t &obj) {
  j = json{{"devices", obj.devices}};
}

void from_json(const json &j, hvctl::netprov::devices_t &obj) {
  if (j.contains("devices") && !j["devices"].is_null())
    j.at("devices").get_to(obj.devices);
  else
    obj.devices.clear();
}

} // namespace nlohmann
