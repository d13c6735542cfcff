#pragma once
/**
 * @file transport_linux_udp.hpp
 * @brief Linux UDP transport (header-only, POSIX sockets, poll-based timeouts).
 *
 * Depends on: sys/socket.h, netinet/in.h, arpa/inet.h, netdb.h, poll.h, unistd.h.
 */

#if !defined(__linux__)
#  error "transport_linux_udp.hpp is Linux-only."
#endif

#include "pumplink/transport/transport_base.hpp"
#include <string>
#include <cerrno>
#include <cstring>
#include <unistd.h>
#include <poll.h>
#include <netdb.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace pumplink::transport {

class LinuxUdp : public IDatagramTransport {
public:
  LinuxUdp() = default;
  ~LinuxUdp() override { end(); }

  LinuxUdp(const LinuxUdp&) = delete;
  LinuxUdp& operator=(const LinuxUdp&) = delete;

  bool begin(const Config& cfg) override {
    end();
    mtu_ = cfg.mtu ? cfg.mtu : 1500;

    fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (fd_ < 0) return false;

    int yes = 1;
    ::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port   = htons(cfg.port);
    if (cfg.bind_host.empty() || cfg.bind_host == "0.0.0.0") {
      addr.sin_addr.s_addr = htonl(INADDR_ANY);
    } else if (::inet_pton(AF_INET, cfg.bind_host.c_str(), &addr.sin_addr) != 1) {
      end();
      return false;
    }

    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
      end();
      return false;
    }
    return true;
  }

  void end() override {
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
  }

  bool is_open() const override { return fd_ >= 0; }

  RxResult recv(uint8_t* out, std::size_t cap, std::size_t& out_len,
                Endpoint& from, int timeout_ms) override {
    out_len = 0;
    if (fd_ < 0 || cap == 0) return RxResult::Error;

    pollfd pfd{fd_, POLLIN, 0};
    int pr = ::poll(&pfd, 1, timeout_ms);
    if (pr == 0) return RxResult::None;
    if (pr < 0)  return (errno == EINTR) ? RxResult::None : RxResult::Error;
    if (!(pfd.revents & POLLIN)) return RxResult::Error;

    sockaddr_in src{};
    socklen_t sl = sizeof(src);
    ssize_t r = ::recvfrom(fd_, out, cap, 0, reinterpret_cast<sockaddr*>(&src), &sl);
    if (r < 0) return (errno == EAGAIN || errno == EWOULDBLOCK) ? RxResult::None : RxResult::Error;

    char host[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, &src.sin_addr, host, sizeof(host));
    from.host = host;
    from.port = ntohs(src.sin_port);
    out_len = static_cast<std::size_t>(r);
    return RxResult::Ok;
  }

  TxResult send(const uint8_t* data, std::size_t len, const Endpoint& to) override {
    if (fd_ < 0 || !data || !len) return TxResult::Error;

    sockaddr_in dst{};
    if (!resolve(to, dst)) return TxResult::Error;

    ssize_t w = ::sendto(fd_, data, len, 0, reinterpret_cast<const sockaddr*>(&dst), sizeof(dst));
    if (w < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return TxResult::Busy;
    return (w == static_cast<ssize_t>(len)) ? TxResult::Ok : TxResult::Error;
  }

  const char* name() const override { return "linux-udp"; }
  std::size_t mtu() const override { return mtu_; }

private:
  // Dotted quad first; fall back to getaddrinfo for host names.
  static bool resolve(const Endpoint& ep, sockaddr_in& out) {
    out = sockaddr_in{};
    out.sin_family = AF_INET;
    out.sin_port   = htons(ep.port);
    if (::inet_pton(AF_INET, ep.host.c_str(), &out.sin_addr) == 1) return true;

    addrinfo hints{};
    hints.ai_family   = AF_INET;
    hints.ai_socktype = SOCK_DGRAM;
    addrinfo* res = nullptr;
    if (::getaddrinfo(ep.host.c_str(), nullptr, &hints, &res) != 0 || !res) return false;
    out.sin_addr = reinterpret_cast<sockaddr_in*>(res->ai_addr)->sin_addr;
    ::freeaddrinfo(res);
    return true;
  }

  int fd_{-1};
  std::size_t mtu_{1500};
};

} // namespace pumplink::transport
