// ============================================================================
// connection.cpp: implementation for connection.hpp
// ============================================================================

#include "pumplink/connection.hpp"
#include "pumplink/hex.hpp"
#include "pumplink/log.hpp"
#include "pumplink/parser.hpp"

#include <chrono>
#include <utility>

namespace pumplink {

using transport::Endpoint;
using transport::RxResult;
using transport::TxResult;

void apply_dialect(ConnectionConfig& cfg, Dialect dialect) {
    switch (dialect) {
    case Dialect::Split:
        cfg.port_read  = 9999;
        cfg.port_write = 10000;
        break;
    case Dialect::Symmetric:
        cfg.port_read  = 10000;
        cfg.port_write = 10001;
        break;
    }
}

const char* rx_status_name(RxStatus s) {
    switch (s) {
        case RxStatus::Message: return "message";
        case RxStatus::Timeout: return "timeout";
        case RxStatus::Closed:  return "closed";
        case RxStatus::Error:   return "error";
    }
    return "unknown";
}

Connection::Connection(transport::IDatagramTransport& transport, ConnectionConfig cfg)
    : transport_(transport), cfg_(std::move(cfg)), peer_host_(cfg_.host) {}

Connection::~Connection() { close(); }

bool Connection::open() {
    close();

    transport::Config tc;
    tc.bind_host = cfg_.bind_host;
    tc.port      = cfg_.port_listen;
    tc.mtu       = cfg_.mtu;

    if (!transport_.begin(tc)) {
        PUMPLINK_LOG_ERROR("msg=\"bind failed\" transport=" << transport_.name()
                           << " bind=" << cfg_.bind_host << ':' << cfg_.port_listen);
        return false;
    }

    rx_buf_.assign(transport_.mtu(), 0);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        stats_        = Stats{};
        peer_host_    = cfg_.host;
        peer_adopted_ = false;
    }
    PUMPLINK_LOG_INFO("msg=\"session open\" transport=" << transport_.name()
                      << " listen=" << cfg_.port_listen << " peer=" << cfg_.host
                      << " read=" << cfg_.port_read << " write=" << cfg_.port_write);
    return true;
}

void Connection::close() {
    if (transport_.is_open()) {
        transport_.end();
        PUMPLINK_LOG_INFO("msg=\"session closed\"");
    }
}

TxResult Connection::send(const Command& command) {
    uint16_t port = 0;
    if (is_read_request(command))       port = cfg_.port_read;
    else if (is_write_request(command)) port = cfg_.port_write;
    else {
        PUMPLINK_LOG_ERROR("msg=\"refusing to send non-request\" " << describe(command));
        std::lock_guard<std::mutex> lock(state_mutex_);
        ++stats_.send_failures;
        return TxResult::Error;
    }

    const std::vector<uint8_t> frame = Message::slave(command).to_bytes();
    const Endpoint to{peer_host(), port};

    const TxResult r = transport_.send(frame.data(), frame.size(), to);

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (r == TxResult::Ok) {
        ++stats_.frames_sent;
        PUMPLINK_LOG_DEBUG("msg=tx to=" << to.host << ':' << to.port
                           << " tx=\"" << to_hex(frame) << "\" " << describe(command));
    } else {
        ++stats_.send_failures;
        PUMPLINK_LOG_ERROR("msg=\"send failed\" to=" << to.host << ':' << to.port
                           << " result=" << (r == TxResult::Busy ? "busy" : "error"));
    }
    return r;
}

void Connection::note_sender(const Endpoint& from) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (cfg_.peer_policy == PeerPolicy::AdoptFirstSender && !peer_adopted_) {
        peer_adopted_ = true;
        if (peer_host_ != from.host) {
            PUMPLINK_LOG_INFO("msg=\"adopting peer\" host=" << from.host
                              << " configured=" << cfg_.host);
        }
        peer_host_ = from.host;
        return;
    }
    if (from.host != peer_host_) {
        ++stats_.foreign_host;
        PUMPLINK_LOG_WARN("msg=\"rx from unexpected host\" host=" << from.host
                          << " peer=" << peer_host_);
    }
}

// ---------------------------------------------------------------------------
// next()
// -------
// Receive loop bounded by one deadline. Bad datagrams are logged and skipped
// so the caller only ever sees messages, a timeout, or a transport problem.
// ---------------------------------------------------------------------------
RxStatus Connection::next(Message& out, int timeout_ms) {
    if (!transport_.is_open()) return RxStatus::Closed;

    using clock = std::chrono::steady_clock;
    const bool forever = timeout_ms < 0;
    const auto deadline = clock::now() + std::chrono::milliseconds(forever ? 0 : timeout_ms);

    while (true) {
        int wait_ms = -1;
        if (!forever) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - clock::now());
            wait_ms = left.count() > 0 ? static_cast<int>(left.count()) : 0;
        }

        size_t len = 0;
        Endpoint from;
        const RxResult rr = transport_.recv(rx_buf_.data(), rx_buf_.size(), len, from, wait_ms);

        if (rr == RxResult::Error) {
            if (!transport_.is_open()) return RxStatus::Closed;
            PUMPLINK_LOG_ERROR("msg=\"receive failed\" transport=" << transport_.name());
            return RxStatus::Error;
        }

        if (rr == RxResult::Ok) {
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                ++stats_.datagrams;
            }
            note_sender(from);

            ParseResult pr = parser::parse(rx_buf_.data(), len);
            if (pr.ok()) {
                {
                    std::lock_guard<std::mutex> lock(state_mutex_);
                    ++stats_.messages;
                }
                PUMPLINK_LOG_DEBUG("msg=rx from=" << from.host << ':' << from.port
                                   << " rx=\"" << to_hex(rx_buf_.data(), len) << "\" "
                                   << parser::describe(pr.message));
                out = std::move(pr.message);
                return RxStatus::Message;
            }

            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                ++stats_.parse_errors;
            }
            PUMPLINK_LOG_ERROR("msg=\"parse failed\" from=" << from.host << ':' << from.port
                               << " reason=" << parse_status_name(pr.status)
                               << " rx=\"" << to_hex(rx_buf_.data(), len) << "\""
                               << " detail=\"" << pr.detail << "\"");
        }

        if (!forever && clock::now() >= deadline) return RxStatus::Timeout;
    }
}

std::string Connection::peer_host() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return peer_host_;
}

Connection::Stats Connection::stats() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return stats_;
}

} // namespace pumplink
