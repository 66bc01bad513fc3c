#include "dhcp_server.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <format>
#include <net/if.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <magic_enum/magic_enum.hpp>

#include "exception.hpp"
#include "logging.hpp"

using namespace std::chrono_literals;

namespace hvctl {
namespace netprov {

namespace {

constexpr uint8_t bootrequest = 1;

constexpr uint8_t bootreply = 2;

constexpr size_t header_size = 236;

constexpr std::array<uint8_t, 4> magic_cookie = {99, 130, 83, 99};

uint32_t read_u32(std::string_view data, size_t off) {
  return (uint32_t(uint8_t(data[off])) << 24) |
         (uint32_t(uint8_t(data[off + 1])) << 16) |
         (uint32_t(uint8_t(data[off + 2])) << 8) |
         uint32_t(uint8_t(data[off + 3]));
}

uint16_t read_u16(std::string_view data, size_t off) {
  return static_cast<uint16_t>((uint8_t(data[off]) << 8) |
                               uint8_t(data[off + 1]));
}

void write_u32(std::string &out, uint32_t v) {
  out.push_back(static_cast<char>(v >> 24));
  out.push_back(static_cast<char>(v >> 16));
  out.push_back(static_cast<char>(v >> 8));
  out.push_back(static_cast<char>(v));
}

void write_u16(std::string &out, uint16_t v) {
  out.push_back(static_cast<char>(v >> 8));
  out.push_back(static_cast<char>(v));
}

std::string ipv4_bytes(ipv4_t ip) {
  std::string rv;
  write_u32(rv, ip);
  return rv;
}

} // namespace

std::optional<ipv4_t> parse_ipv4(const std::string &s) {
  in_addr addr;
  if (::inet_pton(AF_INET, s.c_str(), &addr) != 1)
    return std::nullopt;
  return ntohl(addr.s_addr);
}

std::string format_ipv4(ipv4_t ip) {
  return std::format("{}.{}.{}.{}", (ip >> 24) & 0xff, (ip >> 16) & 0xff,
                     (ip >> 8) & 0xff, ip & 0xff);
}

std::string format_mac(const mac_t &mac) {
  return std::format("{:02x}:{:02x}:{:02x}:{:02x}:{:02x}:{:02x}", mac[0],
                     mac[1], mac[2], mac[3], mac[4], mac[5]);
}

mac_t dhcp_message_t::mac() const {
  mac_t rv;
  std::copy_n(chaddr.begin(), rv.size(), rv.begin());
  return rv;
}

std::optional<dhcp_message_type_t> dhcp_message_t::message_type() const {
  auto it = options.find(static_cast<uint8_t>(dhcp_option_t::message_type));
  if (it == options.end() || it->second.size() != 1)
    return std::nullopt;
  return magic_enum::enum_cast<dhcp_message_type_t>(
      static_cast<uint8_t>(it->second[0]));
}

std::optional<ipv4_t> dhcp_message_t::ipv4_option(dhcp_option_t opt) const {
  auto it = options.find(static_cast<uint8_t>(opt));
  if (it == options.end() || it->second.size() != 4)
    return std::nullopt;
  return read_u32(it->second, 0);
}

void dhcp_message_t::set_option(dhcp_option_t opt, std::string value) {
  options.insert_or_assign(static_cast<uint8_t>(opt), std::move(value));
}

void dhcp_message_t::set_ipv4_option(dhcp_option_t opt, ipv4_t ip) {
  set_option(opt, ipv4_bytes(ip));
}

std::optional<dhcp_message_t> parse_dhcp_message(std::string_view data) {
  if (data.size() < header_size + magic_cookie.size())
    return std::nullopt;
  for (size_t i = 0; i < magic_cookie.size(); i++)
    if (uint8_t(data[header_size + i]) != magic_cookie[i])
      return std::nullopt;

  dhcp_message_t msg;
  msg.op = uint8_t(data[0]);
  msg.htype = uint8_t(data[1]);
  msg.hlen = uint8_t(data[2]);
  msg.hops = uint8_t(data[3]);
  msg.xid = read_u32(data, 4);
  msg.secs = read_u16(data, 8);
  msg.flags = read_u16(data, 10);
  msg.ciaddr = read_u32(data, 12);
  msg.yiaddr = read_u32(data, 16);
  msg.siaddr = read_u32(data, 20);
  msg.giaddr = read_u32(data, 24);
  for (size_t i = 0; i < msg.chaddr.size(); i++)
    msg.chaddr[i] = uint8_t(data[28 + i]);

  size_t off = header_size + magic_cookie.size();
  while (off < data.size()) {
    uint8_t code = uint8_t(data[off++]);
    if (code == static_cast<uint8_t>(dhcp_option_t::pad))
      continue;
    if (code == static_cast<uint8_t>(dhcp_option_t::end))
      break;
    if (off >= data.size())
      return std::nullopt;
    size_t len = uint8_t(data[off++]);
    if (off + len > data.size())
      return std::nullopt;
    msg.options.insert_or_assign(code, std::string(data.substr(off, len)));
    off += len;
  }
  return msg;
}

std::string serialize_dhcp_message(const dhcp_message_t &msg) {
  std::string out;
  out.reserve(300);
  out.push_back(static_cast<char>(msg.op));
  out.push_back(static_cast<char>(msg.htype));
  out.push_back(static_cast<char>(msg.hlen));
  out.push_back(static_cast<char>(msg.hops));
  write_u32(out, msg.xid);
  write_u16(out, msg.secs);
  write_u16(out, msg.flags);
  write_u32(out, msg.ciaddr);
  write_u32(out, msg.yiaddr);
  write_u32(out, msg.siaddr);
  write_u32(out, msg.giaddr);
  for (auto b : msg.chaddr)
    out.push_back(static_cast<char>(b));
  // sname and file
  out.append(192, '\0');
  for (auto b : magic_cookie)
    out.push_back(static_cast<char>(b));
  for (const auto &[code, value] : msg.options) {
    out.push_back(static_cast<char>(code));
    out.push_back(static_cast<char>(value.size()));
    out.append(value);
  }
  out.push_back(static_cast<char>(dhcp_option_t::end));
  // BOOTP minimum message size
  if (out.size() < 300)
    out.append(300 - out.size(), '\0');
  return out;
}

dhcp_lease_pool_t::dhcp_lease_pool_t(ipv4_t first, ipv4_t last,
                                     std::chrono::seconds lease_duration)
    : lease_duration(lease_duration), first_(first), last_(last) {
  if (first > last)
    throw exception<value_error>("dhcp_lease_pool", "range",
                                 "first <= last",
                                 std::format("{} - {}", format_ipv4(first),
                                             format_ipv4(last)));
}

bool dhcp_lease_pool_t::is_free(ipv4_t ip, const mac_t &mac) const {
  auto it = leases_.find(ip);
  if (it == leases_.end())
    return true;
  return it->second.mac == mac || it->second.expiry <= clock_t::now();
}

std::optional<ipv4_t> dhcp_lease_pool_t::offer(const mac_t &mac,
                                               std::optional<ipv4_t> hint) {
  if (auto current = lease_of(mac))
    return current;
  if (hint.has_value() && hint.value() >= first_ && hint.value() <= last_ &&
      is_free(hint.value(), mac))
    return hint;
  for (ipv4_t ip = first_; ip <= last_; ip++) {
    if (is_free(ip, mac))
      return ip;
    if (ip == last_)
      break;
  }
  return std::nullopt;
}

bool dhcp_lease_pool_t::acknowledge(const mac_t &mac, ipv4_t ip) {
  if (ip < first_ || ip > last_ || !is_free(ip, mac))
    return false;
  // A client holds at most one lease
  for (auto it = leases_.begin(); it != leases_.end();) {
    if (it->second.mac == mac && it->first != ip)
      it = leases_.erase(it);
    else
      ++it;
  }
  leases_.insert_or_assign(ip,
                           lease_t{mac, clock_t::now() + lease_duration});
  return true;
}

void dhcp_lease_pool_t::release(const mac_t &mac) {
  for (auto it = leases_.begin(); it != leases_.end();) {
    if (it->second.mac == mac)
      it = leases_.erase(it);
    else
      ++it;
  }
}

std::optional<ipv4_t> dhcp_lease_pool_t::lease_of(const mac_t &mac) const {
  for (const auto &[ip, lease] : leases_)
    if (lease.mac == mac && lease.expiry > clock_t::now())
      return ip;
  return std::nullopt;
}

dhcp_handler_t::dhcp_handler_t(ipv4_t server, ipv4_t netmask,
                               dhcp_lease_pool_t pool)
    : server_(server), netmask_(netmask), pool_(std::move(pool)) {}

dhcp_message_t dhcp_handler_t::make_reply(const dhcp_message_t &req,
                                          dhcp_message_type_t type,
                                          ipv4_t yiaddr) const {
  dhcp_message_t rep;
  rep.op = bootreply;
  rep.htype = req.htype;
  rep.hlen = req.hlen;
  rep.xid = req.xid;
  rep.flags = req.flags;
  rep.giaddr = req.giaddr;
  rep.chaddr = req.chaddr;
  rep.yiaddr = yiaddr;
  rep.siaddr = server_;
  rep.set_option(dhcp_option_t::message_type,
                 std::string(1, static_cast<char>(type)));
  rep.set_ipv4_option(dhcp_option_t::server_id, server_);
  if (type == dhcp_message_type_t::nak)
    return rep;

  std::string lease;
  write_u32(lease, static_cast<uint32_t>(pool_.lease_duration.count()));
  rep.set_option(dhcp_option_t::lease_time, lease);
  rep.set_ipv4_option(dhcp_option_t::subnet_mask, netmask_);
  rep.set_ipv4_option(dhcp_option_t::router, server_);
  rep.set_ipv4_option(dhcp_option_t::domain_name_server, server_);
  return rep;
}

std::optional<dhcp_message_t>
dhcp_handler_t::handle(const dhcp_message_t &req) {
  if (req.op != bootrequest)
    return std::nullopt;
  auto type = req.message_type();
  if (!type.has_value())
    return std::nullopt;

  const auto mac = req.mac();
  switch (type.value()) {
  case dhcp_message_type_t::discover: {
    auto ip =
        pool_.offer(mac, req.ipv4_option(dhcp_option_t::requested_ip));
    if (!ip.has_value()) {
      warn("[DHCP] no free address for {}", format_mac(mac));
      return std::nullopt;
    }
    debug("[DHCP] offer {} to {}", format_ipv4(ip.value()), format_mac(mac));
    return make_reply(req, dhcp_message_type_t::offer, ip.value());
  }
  case dhcp_message_type_t::request: {
    auto server_id = req.ipv4_option(dhcp_option_t::server_id);
    if (server_id.has_value() && server_id.value() != server_)
      return std::nullopt; // the client chose another server
    auto ip = req.ipv4_option(dhcp_option_t::requested_ip);
    if (!ip.has_value() && req.ciaddr != 0)
      ip = req.ciaddr;
    if (ip.has_value() && pool_.acknowledge(mac, ip.value())) {
      info("[DHCP] lease {} to {}", format_ipv4(ip.value()), format_mac(mac));
      return make_reply(req, dhcp_message_type_t::ack, ip.value());
    }
    return make_reply(req, dhcp_message_type_t::nak, 0);
  }
  case dhcp_message_type_t::release:
  case dhcp_message_type_t::decline:
    debug("[DHCP] {} from {}", magic_enum::enum_name(type.value()),
          format_mac(mac));
    pool_.release(mac);
    return std::nullopt;
  default:
    return std::nullopt;
  }
}

dhcp_server_t::dhcp_server_t(dhcp_handler_t handler)
    : notify_t("dhcp"), handler_(std::move(handler)) {}

dhcp_server_t::~dhcp_server_t() { stop(); }

void dhcp_server_t::start(const std::string &interface, uint16_t port) {
  int fd = ::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
  if (fd < 0)
    throw exception(std::format("dhcp socket: {}", std::strerror(errno)));

  int on = 1;
  auto fail = [fd](const std::string &what) {
    auto msg = std::format("dhcp {}: {}", what, std::strerror(errno));
    ::close(fd);
    throw exception(msg);
  };
  if (::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) < 0)
    fail("SO_REUSEADDR");
  if (::setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on)) < 0)
    fail("SO_BROADCAST");
  if (!interface.empty() &&
      ::setsockopt(fd, SOL_SOCKET, SO_BINDTODEVICE, interface.c_str(),
                   static_cast<socklen_t>(interface.size())) < 0)
    fail(std::format("bind to device {}", interface));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0)
    fail(std::format("bind :{}", port));

  fd_ = fd;
  // Clients listen one port above the server
  client_port_ = static_cast<uint16_t>(port + 1);
  running_.store(true);
  thread_ = std::thread([this] { serve(); });
  info("[DHCP] listening on {} port {}",
       interface.empty() ? "*" : interface, port);
}

void dhcp_server_t::stop() {
  running_.store(false);
  join_or_detach(thread_);
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

void dhcp_server_t::serve() {
  std::string buf(1500, '\0');
  while (running_.load()) {
    pollfd pfd{fd_, POLLIN, 0};
    int n = ::poll(&pfd, 1, 200);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      error("[DHCP] poll: {}", std::strerror(errno));
      notify("error");
      return;
    }
    if (n == 0)
      continue;

    sockaddr_in from{};
    socklen_t fromlen = sizeof(from);
    ssize_t len = ::recvfrom(fd_, buf.data(), buf.size(), 0,
                             reinterpret_cast<sockaddr *>(&from), &fromlen);
    if (len < 0) {
      if (errno == EINTR || errno == EAGAIN)
        continue;
      error("[DHCP] recvfrom: {}", std::strerror(errno));
      notify("error");
      return;
    }

    auto req = parse_dhcp_message(std::string_view(buf.data(), len));
    if (!req.has_value())
      continue;
    auto rep = handler_.handle(req.value());
    if (!rep.has_value())
      continue;

    sockaddr_in to{};
    to.sin_family = AF_INET;
    to.sin_port = htons(client_port_);
    to.sin_addr.s_addr = htonl(INADDR_BROADCAST);
    if (rep->giaddr != 0) {
      to.sin_port = htons(static_cast<uint16_t>(client_port_ - 1));
      to.sin_addr.s_addr = htonl(rep->giaddr);
    }
    auto out = serialize_dhcp_message(rep.value());
    if (::sendto(fd_, out.data(), out.size(), 0,
                 reinterpret_cast<sockaddr *>(&to), sizeof(to)) < 0)
      warn("[DHCP] sendto: {}", std::strerror(errno));
  }
}

dhcp_handler_t make_bridge_dhcp_handler(const std::string &bridge_address) {
  auto server = parse_ipv4(bridge_address);
  if (!server.has_value())
    throw exception<value_error>("dhcp", "bridge_address", "IPv4 address",
                                 bridge_address);
  ipv4_t net = server.value() & 0xffffff00u;
  return dhcp_handler_t(
      server.value(), 0xffffff00u,
      dhcp_lease_pool_t(net | 2, net | 254, std::chrono::hours(2)));
}

} // namespace netprov
} // namespace hvctl
