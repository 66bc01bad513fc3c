#include "vm_config.hpp"

#include "exception.hpp"

namespace hvctl {

vm_config_t parse_vm_config(const std::string &text) {
  try {
    return nlohmann::json::parse(text).get<vm_config_t>();
  } catch (const nlohmann::json::exception &e) {
    throw exception<value_error>(
        std::format("invalid VM configuration: {}", e.what()));
  }
}

} // namespace hvctl

namespace nlohmann {

template <typename T>
static void get_if_present(const json &j, const char *key, T &out) {
  if (j.contains(key) && !j[key].is_null())
    j.at(key).get_to(out);
}

void to_json(json &j, const hvctl::network_config_t &obj) {
  j = json{{"ip", obj.ip},         {"mask", obj.mask}, {"gateway", obj.gateway},
           {"udp", obj.udp},       {"tcp", obj.tcp},   {"http", obj.http},
           {"https", obj.https}};
}

void from_json(const json &j, hvctl::network_config_t &obj) {
  get_if_present(j, "ip", obj.ip);
  get_if_present(j, "mask", obj.mask);
  get_if_present(j, "gateway", obj.gateway);
  get_if_present(j, "udp", obj.udp);
  get_if_present(j, "tcp", obj.tcp);
  get_if_present(j, "http", obj.http);
  get_if_present(j, "https", obj.https);
}

void to_json(json &j, const hvctl::vm_config_t &obj) {
  j = json{
      {"vm",
       {{"cpus", obj.vm.cpus},
        {"ram", obj.vm.ram_mib},
        {"kernel", obj.vm.kernel},
        {"kernel_args", obj.vm.kernel_args}}},
      {"system", {{"hostname", obj.system.hostname}}},
      {"info",
       {{"name", obj.info.name},
        {"author", obj.info.author},
        {"summary", obj.info.summary},
        {"version", obj.info.version},
        {"url", obj.info.url}}},
      {"networks", obj.networks},
  };
}

void from_json(const json &j, hvctl::vm_config_t &obj) {
  if (!j.is_object())
    throw hvctl::exception<hvctl::value_error>(
        "VM configuration must be an object");
  if (j.contains("vm")) {
    const auto &vm = j.at("vm");
    get_if_present(vm, "cpus", obj.vm.cpus);
    get_if_present(vm, "ram", obj.vm.ram_mib);
    get_if_present(vm, "kernel", obj.vm.kernel);
    get_if_present(vm, "kernel_args", obj.vm.kernel_args);
  }
  if (j.contains("system"))
    get_if_present(j.at("system"), "hostname", obj.system.hostname);
  if (j.contains("info")) {
    const auto &info = j.at("info");
    get_if_present(info, "name", obj.info.name);
    get_if_present(info, "author", obj.info.author);
    get_if_present(info, "summary", obj.info.summary);
    get_if_present(info, "version", obj.info.version);
    get_if_present(info, "url", obj.info.url);
  }
  get_if_present(j, "networks", obj.networks);
}

} // namespace nlohmann
