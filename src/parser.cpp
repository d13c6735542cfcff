/**
 * @file parser.cpp
 * @brief Frame decoder and the human/JSON renderings declared in parser.hpp.
 *
 * JSON output uses nlohmann::json; it is only reached from logging and the CLI, never
 * from the receive path itself.
 */

#include "pumplink/parser.hpp"
#include "pumplink/checksum.hpp"
#include "pumplink/hex.hpp"
#include "pumplink/stuffing.hpp"

#include <iomanip>
#include <sstream>
#include <type_traits>

#include "nlohmann/json.hpp"
using nlohmann::json;

namespace pumplink {
namespace parser {

// ---------------------------------------------------------------------------
// Shared frame walk for master and slave frames.
//
//   header_size  bytes before the payload (5 master, 3 slave)
//   cs_from      first byte covered by the checksum (2 master, 0 slave)
//
// The length byte is always the last header byte and the command byte the one
// before it.
// ---------------------------------------------------------------------------
static ParseResult parse_frame(const uint8_t* data, size_t n, uint8_t start,
                               size_t header_size, size_t cs_from) {
    ParseResult r;

    std::vector<uint8_t> buf;
    stuffing::unescape(data, n, start, buf);

    if (buf.size() < header_size) {
        r.status = ParseStatus::BadLength;
        r.detail = "invalid packet length: " + to_hex(data, n);
        return r;
    }

    const size_t len = buf[header_size - 1];
    if (buf.size() < header_size + len + 1) {
        r.status = ParseStatus::BadLength;
        r.detail = "invalid packet length: " + to_hex(data, n);
        return r;
    }

    const uint8_t code     = buf[header_size - 2];
    const uint8_t received = buf[header_size + len];
    const uint8_t computed = checksum(buf.data() + cs_from, header_size + len - cs_from, start);
    if (computed != received) {
        std::ostringstream os;
        os << std::hex << std::uppercase << std::setfill('0')
           << "invalid checksum " << std::setw(2) << static_cast<int>(computed)
           << " expected " << std::setw(2) << static_cast<int>(received);
        r.status = ParseStatus::BadChecksum;
        r.detail = os.str();
        return r;
    }

    Command cmd;
    std::string why;
    r.status = decode_command(code, buf.data() + header_size, len, cmd, &why);
    if (!r.ok()) {
        r.detail = why + " (" + to_hex(data, n) + ")";
        return r;
    }

    r.message = (start == START_MASTER) ? Message::master(buf[2], std::move(cmd))
                                        : Message::slave(std::move(cmd));
    return r;
}

ParseResult parse(const uint8_t* data, size_t n) {
    ParseResult r;
    if (n == 0 || data == nullptr) {
        r.status = ParseStatus::EmptyPacket;
        r.detail = "empty packet";
        return r;
    }

    switch (data[0]) {
    case START_MASTER:
        return parse_frame(data, n, START_MASTER, MASTER_HEADER_SIZE, 2);
    case START_SLAVE:
        return parse_frame(data, n, START_SLAVE, SLAVE_HEADER_SIZE, 0);
    case START_ACK:
        r.message = Message::ack();
        break;
    case START_NAK:
        r.message = Message::nak();
        break;
    default:
        r.message = Message::unknown(data[0], std::vector<uint8_t>(data + 1, data + n));
        break;
    }
    r.status = ParseStatus::Ok;
    return r;
}

// ---------------------------------------------------------------------------
// describe()
// ---------------------------------------------------------------------------
std::string describe(const Message& msg) {
    std::ostringstream os;
    os << "type=" << type_name(msg.type());
    switch (msg.type()) {
    case Message::Type::Master:
        os << " addr=0x" << std::hex << std::setw(2) << std::setfill('0')
           << static_cast<int>(msg.address()) << std::dec
           << ' ' << pumplink::describe(msg.command());
        break;
    case Message::Type::Slave:
        os << ' ' << pumplink::describe(msg.command());
        break;
    case Message::Type::Unknown:
        os << " start=0x" << std::hex << std::setw(2) << std::setfill('0')
           << static_cast<int>(msg.start()) << std::dec
           << " bytes=" << msg.data().size();
        break;
    case Message::Type::Ack:
    case Message::Type::Nak:
        break;
    }
    return os.str();
}

// ---------------------------------------------------------------------------
// to_json()
// ---------------------------------------------------------------------------
namespace {

struct CommandToJson {
    json& j;

    void operator()(const RequestReadNull&) const {}
    void operator()(const RequestWriteNull&) const {}
    void operator()(const RequestRead& c) const { j["register"] = c.reg; }
    void operator()(const ResponseWrite& c) const { j["register"] = c.reg; }

    void operator()(const RequestWrite& c) const {
        j["register"] = c.reg;
        j["value"] = c.value;
    }

    void operator()(const ResponseRead& c) const {
        j["register"] = c.reg;
        j["value"] = c.value;
    }

    void operator()(const ResponseData& c) const {
        json params = json::object();
        for (const auto& kv : c.parameters) params[std::to_string(kv.first)] = kv.second;
        j["parameters"] = params;
    }

    void operator()(const ResponseRmu& c) const {
        j["data"] = to_hex(c.data.data(), c.data.size());
    }

    void operator()(const ResponseProduct& c) const {
        j["unknown"] = to_hex(c.unknown, 3);
        j["product"] = std::string(c.product.begin(), c.product.end());
    }

    void operator()(const CommandUnknown& c) const {
        j["data"] = to_hex(c.data.data(), c.data.size());
    }
};

} // namespace

std::string to_json(const Message& msg, int indent) {
    json j;
    j["type"] = type_name(msg.type());

    if (msg.type() == Message::Type::Master) j["address"] = msg.address();

    if (msg.has_command()) {
        json c;
        c["kind"] = kind_name(kind_of(msg.command()));
        c["code"] = command_code(msg.command());
        std::visit(CommandToJson{c}, msg.command());
        j["command"] = c;
    } else if (msg.type() == Message::Type::Unknown) {
        j["start"] = msg.start();
        j["data"] = to_hex(msg.data());
    }
    return j.dump(indent);
}

} // namespace parser
} // namespace pumplink
