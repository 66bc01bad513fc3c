#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include "exception.hpp"
#include "logging.hpp"
#include "qemu.hpp"

namespace hvctl {

/**
 * @return The bound port, or 0 if `port` could not be bound
 */
static uint16_t try_bind(int type, uint16_t port) {
  int fd = ::socket(AF_INET, type | SOCK_CLOEXEC, 0);
  if (fd < 0)
    throw exception<runtime_error>(
        std::format("socket failed: {}", std::strerror(errno)));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = htons(port);

  uint16_t bound = 0;
  if (::bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0) {
    socklen_t len = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len) == 0)
      bound = ntohs(addr.sin_port);
  }
  ::close(fd);
  return bound;
}

uint16_t bind_port(const std::string &protocol, const std::string &port) {
  int type = protocol == "udp" ? SOCK_DGRAM : SOCK_STREAM;

  int requested;
  try {
    requested = std::stoi(port);
  } catch (const std::logic_error &) {
    throw exception<value_error>("qemu", "port", "integer", port);
  }
  if (requested < 0 || requested > 65535)
    throw exception<value_error>("qemu", "port", "0..65535", port);

  if (requested > 0) {
    if (auto bound = try_bind(type, static_cast<uint16_t>(requested)))
      return bound;
    warn("{} port {} is taken, using a random port", protocol, port);
  }

  auto bound = try_bind(type, 0);
  if (!bound)
    throw exception<runtime_error>(
        std::format("failed to bind a {} port for {}", protocol, port));
  return bound;
}

void bind_routes(std::vector<network_interface_t> &routes) {
  auto bind_all = [](std::vector<route_map_t> &maps,
                     const std::string &protocol) {
    for (auto &m : maps)
      m.address = std::format("localhost:{}", bind_port(protocol, m.port));
  };
  for (auto &route : routes) {
    bind_all(route.http, "tcp");
    bind_all(route.https, "tcp");
    bind_all(route.tcp, "tcp");
    bind_all(route.udp, "udp");
  }
}

} // namespace hvctl
