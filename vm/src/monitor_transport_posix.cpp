#include "monitor_transport.hpp"

#include <cerrno>
#include <cstring>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include "exception.hpp"

namespace hvctl {

monitor_connection_t::~monitor_connection_t() {
  if (fd_ >= 0)
    ::close(fd_);
}

bool monitor_connection_t::send(const std::string &command) {
  size_t sent = 0;
  while (sent < command.size()) {
    ssize_t n = ::send(fd_, command.data() + sent, command.size() - sent,
                       MSG_NOSIGNAL);
    if (n < 0 && errno == EINTR)
      continue;
    if (n < 0 && (errno == EPIPE || errno == ECONNRESET))
      return false;
    if (n < 0)
      throw exception<runtime_error>(
          std::format("monitor write failed: {}", std::strerror(errno)));
    sent += n;
  }
  return true;
}

std::unique_ptr<monitor_connection_t>
dial_monitor(const std::filesystem::path &path) {
  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  auto p = path.string();
  if (p.size() >= sizeof(addr.sun_path))
    throw exception<value_error>(
        std::format("monitor socket path too long: {}", p));
  std::memcpy(addr.sun_path, p.c_str(), p.size() + 1);

  int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0)
    throw exception<runtime_error>(
        std::format("socket failed: {}", std::strerror(errno)));
  if (::connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    int e = errno;
    ::close(fd);
    throw exception<runtime_error>(
        std::format("failed to dial monitor {}: {}", p, std::strerror(e)));
  }
  return std::make_unique<monitor_connection_t>(fd);
}

} // namespace hvctl
