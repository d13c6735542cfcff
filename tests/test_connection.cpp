#include <doctest/doctest.h>
#include "pumplink/connection.hpp"
#include "pumplink/hex.hpp"
#include "loopback_transport.hpp"
#include "log_capture.hpp"

using namespace pumplink;
using pumplink::testing::LogCapture;
using pumplink::testing::LoopbackTransport;

using Bytes = std::vector<uint8_t>;

static Bytes hex(const std::string& text) {
    Bytes b;
    REQUIRE(from_hex(text, b));
    return b;
}

static ConnectionConfig make_config(PeerPolicy policy = PeerPolicy::TrustConfigured) {
    ConnectionConfig cfg;
    cfg.host = "10.0.0.2";
    cfg.port_listen = 19999;
    cfg.peer_policy = policy;
    return cfg;
}

TEST_CASE("open binds the listen port and a failed bind is reported") {
    LoopbackTransport t;
    Connection conn(t, make_config());
    CHECK_FALSE(conn.is_open());

    REQUIRE(conn.open());
    CHECK(conn.is_open());
    CHECK(t.config().port == 19999);
    CHECK(t.config().bind_host == "0.0.0.0");
    CHECK(t.config().mtu == 1500);

    conn.close();
    CHECK_FALSE(conn.is_open());

    LogCapture cap;
    t.set_fail_begin(true);
    CHECK_FALSE(conn.open());
    CHECK(cap.count("bind failed") == 1);
}

TEST_CASE("dialects pick the request ports") {
    ConnectionConfig cfg;
    CHECK(cfg.port_read == 9999);
    CHECK(cfg.port_write == 10000);

    apply_dialect(cfg, Dialect::Symmetric);
    CHECK(cfg.port_listen == 9999);
    CHECK(cfg.port_read == 10000);
    CHECK(cfg.port_write == 10001);

    apply_dialect(cfg, Dialect::Split);
    CHECK(cfg.port_read == 9999);
    CHECK(cfg.port_write == 10000);
}

TEST_CASE("reads go to the read port, writes to the write port") {
    LoopbackTransport t;
    ConnectionConfig cfg = make_config();
    apply_dialect(cfg, Dialect::Symmetric);
    Connection conn(t, cfg);
    REQUIRE(conn.open());

    CHECK(conn.send(RequestRead{0x1234}) == transport::TxResult::Ok);
    CHECK(conn.send(RequestWrite{12345, 987654}) == transport::TxResult::Ok);
    CHECK(conn.send(RequestReadNull{}) == transport::TxResult::Ok);
    CHECK(conn.send(RequestWriteNull{}) == transport::TxResult::Ok);

    const auto sent = t.sent();
    REQUIRE(sent.size() == 4);
    CHECK(sent[0].peer.host == "10.0.0.2");
    CHECK(sent[0].peer.port == 10000);
    CHECK(sent[0].bytes == hex("C0 69 02 34 12 8D"));
    CHECK(sent[1].peer.port == 10001);
    CHECK(sent[1].bytes == hex("C0 6B 06 39 30 06 12 0F 00 BF"));
    CHECK(sent[2].peer.port == 10000);
    CHECK(sent[3].peer.port == 10001);

    CHECK(conn.stats().frames_sent == 4);
}

TEST_CASE("responses are not sendable") {
    LoopbackTransport t;
    Connection conn(t, make_config());
    REQUIRE(conn.open());

    LogCapture cap;
    CHECK(conn.send(ResponseRead{1, 2}) == transport::TxResult::Error);
    CHECK(conn.send(ResponseData{}) == transport::TxResult::Error);
    CHECK(t.sent().empty());
    CHECK(conn.stats().send_failures == 2);
    CHECK(cap.count("refusing to send") == 2);
}

TEST_CASE("a transport send failure is counted") {
    LoopbackTransport t;
    Connection conn(t, make_config());
    REQUIRE(conn.open());
    t.set_fail_send(true);

    LogCapture cap;
    CHECK(conn.send(RequestRead{1}) == transport::TxResult::Error);
    CHECK(conn.stats().send_failures == 1);
    CHECK(conn.stats().frames_sent == 0);
    CHECK(cap.count("send failed") == 1);
}

TEST_CASE("next skips malformed datagrams without ending the wait") {
    LoopbackTransport t;
    Connection conn(t, make_config());
    REQUIRE(conn.open());

    t.inject(hex("C0 69 02 34 12 8E"));             // bad checksum
    t.inject(hex("5C 00 20 6A 06 D2 04"));          // truncated
    t.inject(hex("5C 00 20 6A 06 44 9C 1E 00 00 00 8A"));

    LogCapture cap;
    Message msg;
    REQUIRE(conn.next(msg, 500) == RxStatus::Message);
    CHECK(msg.command() == Command{ResponseRead{40004, 30}});

    const auto st = conn.stats();
    CHECK(st.datagrams == 3);
    CHECK(st.messages == 1);
    CHECK(st.parse_errors == 2);
    CHECK(cap.count("parse failed") == 2);
    CHECK(cap.count("reason=bad_checksum") == 1);
    CHECK(cap.count("msg=rx") == 1);
}

TEST_CASE("next times out when only garbage arrives") {
    LoopbackTransport t;
    Connection conn(t, make_config());
    REQUIRE(conn.open());

    LogCapture cap(log::Level::Off);
    Message msg;
    CHECK(conn.next(msg, 20) == RxStatus::Timeout);

    t.inject(hex("C0 69"));
    CHECK(conn.next(msg, 20) == RxStatus::Timeout);
    CHECK(conn.stats().parse_errors == 1);
}

TEST_CASE("next on a closed connection") {
    LoopbackTransport t;
    Connection conn(t, make_config());
    Message msg;
    CHECK(conn.next(msg, 10) == RxStatus::Closed);
}

TEST_CASE("bare messages come through next") {
    LoopbackTransport t;
    Connection conn(t, make_config());
    REQUIRE(conn.open());
    t.inject(Bytes{0x06});
    t.inject(Bytes{0x15});

    Message msg;
    REQUIRE(conn.next(msg, 100) == RxStatus::Message);
    CHECK(msg.type() == Message::Type::Ack);
    REQUIRE(conn.next(msg, 100) == RxStatus::Message);
    CHECK(msg.type() == Message::Type::Nak);
}

TEST_CASE("trust policy logs strangers and still processes them") {
    LoopbackTransport t;
    Connection conn(t, make_config(PeerPolicy::TrustConfigured));
    REQUIRE(conn.open());

    LogCapture cap;
    t.inject(hex("06"), "10.0.0.9");

    Message msg;
    REQUIRE(conn.next(msg, 100) == RxStatus::Message);
    CHECK(msg.type() == Message::Type::Ack);
    CHECK(conn.stats().foreign_host == 1);
    CHECK(conn.peer_host() == "10.0.0.2");
    CHECK(cap.count("host=10.0.0.9 peer=10.0.0.2") == 1);

    t.inject(hex("06"), "10.0.0.2");
    REQUIRE(conn.next(msg, 100) == RxStatus::Message);
    CHECK(conn.stats().foreign_host == 1);
}

TEST_CASE("adopt policy follows the first sender until the session ends") {
    LoopbackTransport t;
    Connection conn(t, make_config(PeerPolicy::AdoptFirstSender));
    REQUIRE(conn.open());

    LogCapture cap;
    Message msg;
    t.inject(hex("06"), "10.0.0.7");
    REQUIRE(conn.next(msg, 100) == RxStatus::Message);
    CHECK(conn.peer_host() == "10.0.0.7");
    CHECK(conn.stats().foreign_host == 0);
    CHECK(cap.count("adopting peer\" host=10.0.0.7") == 1);

    REQUIRE(conn.send(RequestRead{1}) == transport::TxResult::Ok);
    CHECK(t.sent().back().peer.host == "10.0.0.7");

    t.inject(hex("06"), "10.0.0.8");
    REQUIRE(conn.next(msg, 100) == RxStatus::Message);
    CHECK(conn.peer_host() == "10.0.0.7");
    CHECK(conn.stats().foreign_host == 1);

    // a new session starts from the configured peer with fresh stats
    conn.close();
    REQUIRE(conn.open());
    CHECK(conn.peer_host() == "10.0.0.2");
    CHECK(conn.stats().datagrams == 0);
    CHECK(conn.stats().foreign_host == 0);
    CHECK(t.begin_count() == 2);
}
