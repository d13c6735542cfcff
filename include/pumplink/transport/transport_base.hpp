#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal datagram transport interface the Connection is written against.
 *
 * Header-only. Implementations: LinuxUdp (transport_linux_udp.hpp) for real traffic,
 * and an in-memory loopback in the tests.
 */

#include <cstddef>
#include <cstdint>
#include <string>

namespace pumplink::transport {

// Return codes kept simple; callers log and decide.
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2 };

/// Host/port pair. Host is a dotted IPv4 address or a resolvable name.
struct Endpoint {
  std::string host;
  uint16_t    port{0};
};

struct Config {
  std::string bind_host{"0.0.0.0"};
  uint16_t    port{9999};     // local port to bind
  uint16_t    mtu{1500};      // receive buffer size per datagram
};

/**
 * @brief Transport trait every datagram backend provides.
 *
 * Contract:
 *  - begin(cfg) binds the local endpoint; false on failure.
 *  - recv() waits up to timeout_ms for one datagram. RxResult::None on timeout,
 *    Ok with out_len and @p from filled on success.
 *  - send() transmits one datagram to @p to. Safe to call while another thread
 *    is blocked in recv().
 *  - name() is a short identifier for logs.
 */
class IDatagramTransport {
public:
  virtual ~IDatagramTransport() = default;
  virtual bool        begin(const Config& cfg) = 0;
  virtual void        end() = 0;
  virtual bool        is_open() const = 0;
  virtual RxResult    recv(uint8_t* out, std::size_t cap, std::size_t& out_len,
                           Endpoint& from, int timeout_ms) = 0;
  virtual TxResult    send(const uint8_t* data, std::size_t len, const Endpoint& to) = 0;
  virtual const char* name() const = 0;
  virtual std::size_t mtu() const = 0;
};

} // namespace pumplink::transport
