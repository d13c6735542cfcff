/**
 * @file message.cpp
 * @brief Implementation of the frame envelope and its encoder.
 *
 * Refer to `message.hpp` for the frame layouts; the decoder lives in parser.cpp.
 */
#include "pumplink/message.hpp"
#include "pumplink/checksum.hpp"
#include "pumplink/stuffing.hpp"

#include <utility>

namespace pumplink {

// --- Factories

Message Message::master(uint8_t address, Command command) {
    Message m(Type::Master, START_MASTER);
    m.address_ = address;
    m.command_ = std::move(command);
    return m;
}

Message Message::slave(Command command) {
    Message m(Type::Slave, START_SLAVE);
    m.command_ = std::move(command);
    return m;
}

Message Message::ack() { return Message(Type::Ack, START_ACK); }

Message Message::nak() { return Message(Type::Nak, START_NAK); }

Message Message::unknown(uint8_t start, std::vector<uint8_t> data) {
    Message m(Type::Unknown, start);
    m.data_ = std::move(data);
    return m;
}

// --- Encoding

/**
 * Layout before stuffing:
 *   master: [5C][00][addr][cmd][len][payload...][cs]   cs over [addr .. payload end]
 *   slave:  [C0][cmd][len][payload...][cs]             cs over [C0 .. payload end]
 */
std::vector<uint8_t> Message::to_bytes() const {
    switch (type_) {
    case Type::Ack:
    case Type::Nak:
        return {start_};

    case Type::Unknown: {
        std::vector<uint8_t> out;
        out.reserve(1 + data_.size());
        out.push_back(start_);
        out.insert(out.end(), data_.begin(), data_.end());
        return out;
    }

    case Type::Master:
    case Type::Slave:
        break;
    }

    std::vector<uint8_t> payload;
    payload.reserve(MAX_PAYLOAD);
    encode_payload(command_, payload);

    std::vector<uint8_t> frame;
    frame.reserve(MASTER_HEADER_SIZE + payload.size() + 1);
    frame.push_back(start_);

    size_t cs_from = 0;                         // slave: checksum includes the start byte
    if (type_ == Type::Master) {
        frame.push_back(0x00);
        frame.push_back(address_);
        cs_from = 2;                            // master: skip "5C 00"
    }

    frame.push_back(command_code(command_));
    frame.push_back(static_cast<uint8_t>(payload.size()));
    frame.insert(frame.end(), payload.begin(), payload.end());
    frame.push_back(checksum(frame.data() + cs_from, frame.size() - cs_from, start_));

    return stuffing::escape(frame, start_);
}

bool operator==(const Message& a, const Message& b) {
    if (a.type_ != b.type_ || a.start_ != b.start_) return false;
    switch (a.type_) {
        case Message::Type::Master:  return a.address_ == b.address_ && a.command_ == b.command_;
        case Message::Type::Slave:   return a.command_ == b.command_;
        case Message::Type::Unknown: return a.data_ == b.data_;
        case Message::Type::Ack:
        case Message::Type::Nak:     return true;
    }
    return false;
}

const char* type_name(Message::Type t) {
    switch (t) {
        case Message::Type::Master:  return "master";
        case Message::Type::Slave:   return "slave";
        case Message::Type::Ack:     return "ack";
        case Message::Type::Nak:     return "nak";
        case Message::Type::Unknown: return "unknown";
    }
    return "unknown";
}

} // namespace pumplink
