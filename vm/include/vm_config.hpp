/**
 * @file vm_config.hpp
 * @brief VM description handed to `handle_t::prepare`
 * @details
 *
 * JSON shape:
 *
 * ```json
 * {
 *   "vm": {"cpus": 1, "ram": 256, "kernel": "20.9.1", "kernel_args": "..."},
 *   "system": {"hostname": "app"},
 *   "info": {"name": "app", "author": "", "summary": "", "version": "",
 *            "url": ""},
 *   "networks": [
 *     {"ip": "dhcp", "mask": "", "gateway": "",
 *      "udp": [], "tcp": ["22"], "http": ["80"], "https": []}
 *   ]
 * }
 * ```
 *
 * `ram` is in MiB. Every field is optional.
 */
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace hvctl {

struct vm_spec_t {
  uint32_t cpus = 1;
  uint64_t ram_mib = 256;
  std::string kernel;
  std::string kernel_args;
};

struct system_spec_t {
  std::string hostname;
};

struct info_spec_t {
  std::string name;
  std::string author;
  std::string summary;
  std::string version;
  std::string url;
};

struct network_config_t {
  std::string ip;
  std::string mask;
  std::string gateway;
  std::vector<std::string> udp;
  std::vector<std::string> tcp;
  std::vector<std::string> http;
  std::vector<std::string> https;
};

struct vm_config_t {
  vm_spec_t vm;
  system_spec_t system;
  info_spec_t info;
  std::vector<network_config_t> networks;
};

/**
 * @throw exception_t<value_error> if `text` is not a valid description
 */
vm_config_t parse_vm_config(const std::string &text);

} // namespace hvctl

namespace nlohmann {

void to_json(json &j, const hvctl::vm_config_t &obj);

void from_json(const json &j, hvctl::vm_config_t &obj);

void to_json(json &j, const hvctl::network_config_t &obj);

void from_json(const json &j, hvctl::network_config_t &obj);

} // namespace nlohmann
