#include "link_manager.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <linux/if_tun.h>
#include <linux/sockios.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <unistd.h>

#include "exception.hpp"
#include "logging.hpp"

namespace hvctl {
namespace netprov {

namespace {

/**
 * @brief Owning file descriptor
 */
class fd_t {
public:
  explicit fd_t(int fd) : fd_(fd) {}

  fd_t(const fd_t &) = delete;

  fd_t(fd_t &&other) : fd_(other.fd_) { other.fd_ = -1; }

  fd_t &operator=(const fd_t &) = delete;

  ~fd_t() {
    if (fd_ >= 0)
      ::close(fd_);
  }

  int get() const { return fd_; }

private:
  int fd_;
};

[[noreturn]] void throw_errno(const std::string &what,
                              const std::string &name) {
  throw exception(std::format("{} {}: {}", what, name, std::strerror(errno)));
}

fd_t open_control_socket() {
  fd_t sock(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
  if (sock.get() < 0)
    throw_errno("socket", "AF_INET");
  return sock;
}

ifreq make_ifreq(const std::string &name) {
  if (name.empty() || name.size() >= IFNAMSIZ)
    throw exception<value_error>("link", "name",
                                 std::format("1..{} chars", IFNAMSIZ - 1),
                                 name);
  ifreq ifr;
  std::memset(&ifr, 0, sizeof(ifr));
  std::strncpy(ifr.ifr_name, name.c_str(), IFNAMSIZ - 1);
  return ifr;
}

fd_t attach_tap(const std::string &name) {
  fd_t tun(::open("/dev/net/tun", O_RDWR | O_CLOEXEC));
  if (tun.get() < 0)
    throw_errno("open /dev/net/tun for", name);
  auto ifr = make_ifreq(name);
  ifr.ifr_flags = IFF_TAP | IFF_NO_PI;
  if (::ioctl(tun.get(), TUNSETIFF, &ifr) < 0)
    throw_errno("TUNSETIFF", name);
  return tun;
}

class system_link_manager_t : public link_manager_t {
public:
  bool has_link(const std::string &name) override {
    return ::if_nametoindex(name.c_str()) != 0;
  }

  void create_bridge(const std::string &name) override {
    auto sock = open_control_socket();
    if (::ioctl(sock.get(), SIOCBRADDBR, name.c_str()) < 0) {
      if (errno == EEXIST)
        return;
      throw_errno("create bridge", name);
    }
    info("bridge {} created", name);
  }

  void set_address(const std::string &name, const std::string &address,
                   int prefix_length) override {
    if (prefix_length < 0 || prefix_length > 32)
      throw exception<value_error>("link", "prefix_length", "0..32",
                                   std::to_string(prefix_length));

    auto sock = open_control_socket();
    auto ifr = make_ifreq(name);
    auto *addr = reinterpret_cast<sockaddr_in *>(&ifr.ifr_addr);
    addr->sin_family = AF_INET;
    if (::inet_pton(AF_INET, address.c_str(), &addr->sin_addr) != 1)
      throw exception<value_error>("link", "address", "IPv4 address",
                                   address);
    if (::ioctl(sock.get(), SIOCSIFADDR, &ifr) < 0 && errno != EEXIST)
      throw_errno("set address on", name);

    auto mask = make_ifreq(name);
    auto *mask_addr = reinterpret_cast<sockaddr_in *>(&mask.ifr_netmask);
    mask_addr->sin_family = AF_INET;
    mask_addr->sin_addr.s_addr =
        prefix_length == 0 ? 0 : htonl(~uint32_t(0) << (32 - prefix_length));
    if (::ioctl(sock.get(), SIOCSIFNETMASK, &mask) < 0 && errno != EEXIST)
      throw_errno("set netmask on", name);
  }

  void create_tap(const std::string &name) override {
    auto tun = attach_tap(name);
    if (::ioctl(tun.get(), TUNSETPERSIST, 1) < 0)
      throw_errno("TUNSETPERSIST", name);
    debug("tap {} created", name);
  }

  void set_link_up(const std::string &name) override {
    auto sock = open_control_socket();
    auto ifr = make_ifreq(name);
    if (::ioctl(sock.get(), SIOCGIFFLAGS, &ifr) < 0)
      throw_errno("get flags of", name);
    ifr.ifr_flags |= IFF_UP | IFF_RUNNING;
    if (::ioctl(sock.get(), SIOCSIFFLAGS, &ifr) < 0)
      throw_errno("set up", name);
  }

  void add_to_bridge(const std::string &bridge,
                     const std::string &name) override {
    unsigned int index = ::if_nametoindex(name.c_str());
    if (index == 0)
      throw_errno("lookup", name);
    auto sock = open_control_socket();
    auto ifr = make_ifreq(bridge);
    ifr.ifr_ifindex = static_cast<int>(index);
    if (::ioctl(sock.get(), SIOCBRADDIF, &ifr) < 0)
      throw_errno(std::format("attach to {}", bridge), name);
  }

  void delete_link(const std::string &name) override {
    if (!has_link(name))
      return;
    auto tun = attach_tap(name);
    if (::ioctl(tun.get(), TUNSETPERSIST, 0) < 0)
      throw_errno("TUNSETPERSIST", name);
    debug("tap {} deleted", name);
  }
};

} // namespace

std::shared_ptr<link_manager_t> create_system_link_manager() {
  return create<system_link_manager_t>();
}

} // namespace netprov
} // namespace hvctl
