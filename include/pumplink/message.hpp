/**
 * @file message.hpp
 * @brief Message: the outer frame envelope around one Command.
 *
 * A datagram on the heat-pump link is one of:
 *
 *   - a **master** frame (start 0x5C), sent by the heat pump:
 *       `5C 00 <addr> <cmd> <len> <payload...> <checksum>`
 *   - a **slave** frame (start 0xC0), sent by an accessory:
 *       `C0 <cmd> <len> <payload...> <checksum>`
 *   - a bare **ACK** (0x06) or **NAK** (0x15) byte,
 *   - anything else, kept as an **unknown** message (first byte + remaining bytes).
 *
 * Bytes after the first are stuffed with the frame's start marker (see stuffing.hpp);
 * the checksum rules live in checksum.hpp.
 *
 * Messages are immutable values. Build them with the static factories, turn them into
 * wire bytes with to_bytes(), and get them back from raw datagrams with parser::parse().
 *
 * ### Example
 * @code
 *   auto m = pumplink::Message::slave(pumplink::RequestRead{0x1234});
 *   auto wire = m.to_bytes();   // C0 69 02 34 12 8D
 * @endcode
 */
#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

#include "pumplink/command.hpp"

namespace pumplink {

/// First byte of every datagram.
enum : uint8_t {
    START_MASTER = 0x5C,
    START_SLAVE  = 0xC0,
    START_ACK    = 0x06,
    START_NAK    = 0x15
};

static constexpr size_t MASTER_HEADER_SIZE = 5;  ///< 5C 00 addr cmd len
static constexpr size_t SLAVE_HEADER_SIZE  = 3;  ///< C0 cmd len

class Message {
public:
    enum class Type : uint8_t { Master, Slave, Ack, Nak, Unknown };

    // -------- Factories --------

    static Message master(uint8_t address, Command command);
    static Message slave(Command command);
    static Message ack();
    static Message nak();
    static Message unknown(uint8_t start, std::vector<uint8_t> data);

    /// Default: an unknown message with start byte 0 and no data.
    Message() = default;

    // -------- Getters --------

    Type    type()    const { return type_; }
    uint8_t start()   const { return start_; }

    /// Peer address of a master frame; 0 for every other type.
    uint8_t address() const { return address_; }

    /// Only master and slave frames carry a command.
    bool has_command() const { return type_ == Type::Master || type_ == Type::Slave; }

    /// Meaningful only when has_command(); otherwise an empty CommandUnknown.
    const Command& command() const { return command_; }

    /// Remaining bytes of an unknown message.
    const std::vector<uint8_t>& data() const { return data_; }

    // -------- Encoding --------

    /**
     * @brief Serialize to wire bytes, checksum and stuffing included.
     *
     * Master/slave frames are assembled header + payload + checksum and then escaped
     * with their start marker. ACK/NAK give one byte; unknown messages give the start
     * byte followed by the stored data, unescaped.
     */
    std::vector<uint8_t> to_bytes() const;

    friend bool operator==(const Message& a, const Message& b);
    friend bool operator!=(const Message& a, const Message& b) { return !(a == b); }

private:
    Message(Type type, uint8_t start) : type_(type), start_(start) {}

    Type                 type_{Type::Unknown};
    uint8_t              start_{0};
    uint8_t              address_{0};
    Command              command_{CommandUnknown{}};
    std::vector<uint8_t> data_{};
};

const char* type_name(Message::Type t);

} // namespace pumplink
