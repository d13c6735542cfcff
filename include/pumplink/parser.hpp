#pragma once
/**
 * @file parser.hpp
 * @brief Datagram -> Message decoding, plus text and JSON renderings of a Message.
 * @details
 *   parse() is the single entry point for inbound bytes. It dispatches on the first
 *   byte of the datagram:
 *
 *     0x5C  master frame: unstuff with 0x5C, check length, check checksum, decode command
 *     0xC0  slave frame:  same with 0xC0 and no address byte
 *     0x06  ACK
 *     0x15  NAK
 *     else  unknown message (start byte + remaining bytes, not parsed)
 *
 *   Failures never throw. They come back as a ParseResult whose status is not Ok and
 *   whose detail names the reason together with the raw bytes or the computed and
 *   received checksum, so a receive loop can log the datagram and carry on.
 *
 *   Bytes after the declared frame length are ignored: one UDP datagram may hold a
 *   frame plus padding (the MODBUS40 module is known to append a stray byte).
 *
 *   describe() and to_json() are for humans and scripts (logs, CLI output); they are
 *   not wire formats.
 */

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

#include "pumplink/command.hpp"
#include "pumplink/message.hpp"

namespace pumplink {

struct ParseResult {
    ParseStatus status{ParseStatus::EmptyPacket};
    Message     message{};
    std::string detail{};   ///< empty on success

    bool ok() const { return status == ParseStatus::Ok; }
};

namespace parser {

ParseResult parse(const uint8_t* data, size_t n);

inline ParseResult parse(const std::vector<uint8_t>& data) { return parse(data.data(), data.size()); }

/// "type=master addr=0x20 cmd=read_response reg=40004 value=30"
std::string describe(const Message& msg);

/**
 * @brief JSON object for one message.
 *
 * Keys: "type", plus "address" (master), "command" object with "kind", "code" and the
 * variant's fields (register/value, "parameters" map, "data" hex string, "product"),
 * or "start"/"data" for unknown messages.
 *
 * @param indent  -1 for compact single-line output.
 */
std::string to_json(const Message& msg, int indent = -1);

} // namespace parser
} // namespace pumplink
