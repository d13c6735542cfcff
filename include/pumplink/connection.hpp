/**
 * @page pl-connection pumplink Connection
 * @file connection.hpp
 * @brief Transport session: one bound UDP endpoint, outbound requests, inbound Messages.
 *
 * @details
 * PURPOSE
 * -------
 * The Connection owns the datagram endpoint the heat pump talks to. It does three things:
 *
 *   - send(command): wrap a read or write request in a slave frame and send it to the
 *     heat pump's read port or write port,
 *   - next(message, timeout): hand back the next datagram that parses cleanly,
 *   - keep track of who the peer is and what went wrong (stats()).
 *
 * PORTS AND DIALECTS
 * ------------------
 * The heat pump's MODBUS40 style gateway listens on two ports: one for read requests and
 * one for write requests. Two layouts are seen in the field:
 *
 *   split      read 9999,  write 10000   (default)
 *   symmetric  read 10000, write 10001
 *
 * Both keep the local listen port at 9999. All ports are plain config fields.
 *
 * PEER POLICY
 * -----------
 *   TrustConfigured   the configured host is the peer of record. Datagrams from any other
 *                     host are logged at warn and still processed.
 *   AdoptFirstSender  the first datagram's sender becomes the peer of record and requests
 *                     are sent there from then on. Later strangers are logged and
 *                     processed like above.
 *
 * Host comparison is textual; configure the peer by address, not by name, if you want
 * the foreign-host warning to mean something.
 *
 * ERROR MODEL
 * -----------
 * A datagram that fails to parse is logged (hex dump + reason), counted, and skipped.
 * next() keeps waiting for a good one until its timeout runs out, so a malformed frame
 * never ends the inbound stream.
 *
 * THREADING
 * ---------
 * send() may be called from any thread, including while another thread sits in next().
 * next() itself must be called by one thread at a time (the Controller guarantees this).
 *
 * SESSIONS
 * --------
 * open() starts a session: binds the socket, resets stats and forgets any adopted peer.
 * close() ends it. A closed Connection can be opened again.
 */
#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "pumplink/command.hpp"
#include "pumplink/message.hpp"
#include "pumplink/transport/transport_base.hpp"

namespace pumplink {

static constexpr uint16_t DEFAULT_PORT_LISTEN = 9999;
static constexpr uint16_t DEFAULT_PORT_READ   = 9999;
static constexpr uint16_t DEFAULT_PORT_WRITE  = 10000;

enum class PeerPolicy : uint8_t { TrustConfigured, AdoptFirstSender };
enum class Dialect    : uint8_t { Split, Symmetric };

struct ConnectionConfig {
    std::string host;                          ///< heat pump address
    std::string bind_host{"0.0.0.0"};
    uint16_t    port_listen{DEFAULT_PORT_LISTEN};
    uint16_t    port_read{DEFAULT_PORT_READ};
    uint16_t    port_write{DEFAULT_PORT_WRITE};
    PeerPolicy  peer_policy{PeerPolicy::TrustConfigured};
    uint16_t    mtu{1500};
};

/// Overwrite the read/write ports with the dialect's pair.
void apply_dialect(ConnectionConfig& cfg, Dialect dialect);

/// Result of Connection::next().
enum class RxStatus : uint8_t {
    Message = 0,  ///< @p out holds a decoded message
    Timeout,      ///< nothing parseable arrived in time
    Closed,       ///< the connection is not open
    Error,        ///< the transport failed
};

const char* rx_status_name(RxStatus s);

class Connection {
public:
    struct Stats {
        uint64_t datagrams{0};      ///< datagrams received
        uint64_t messages{0};       ///< datagrams decoded into messages
        uint64_t parse_errors{0};
        uint64_t foreign_host{0};   ///< datagrams from a host other than the peer
        uint64_t frames_sent{0};
        uint64_t send_failures{0};
    };

    Connection(transport::IDatagramTransport& transport, ConnectionConfig cfg);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /// Bind the listen port and start a fresh session. False if the bind fails.
    bool open();
    void close();
    bool is_open() const { return transport_.is_open(); }

    /**
     * @brief Send a read or write request to the peer.
     *
     * Read requests (including the null form) go to port_read, write requests to
     * port_write. Any other command is refused with TxResult::Error.
     */
    transport::TxResult send(const Command& command);

    /**
     * @brief Wait for the next message that parses cleanly.
     *
     * @param out         Receives the message when RxStatus::Message is returned.
     * @param timeout_ms  Upper bound on the wait; negative waits indefinitely.
     */
    RxStatus next(Message& out, int timeout_ms);

    /// Current peer of record (configured or adopted).
    std::string peer_host() const;

    Stats stats() const;

    const ConnectionConfig& config() const { return cfg_; }

private:
    void note_sender(const transport::Endpoint& from);

    transport::IDatagramTransport& transport_;
    ConnectionConfig               cfg_;
    std::vector<uint8_t>           rx_buf_;

    mutable std::mutex state_mutex_;   // guards the members below
    std::string        peer_host_;
    bool               peer_adopted_{false};
    Stats              stats_{};
};

} // namespace pumplink
