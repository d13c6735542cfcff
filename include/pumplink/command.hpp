/**
 * @page pl-commands pumplink Command Set
 * @file command.hpp
 * @brief The closed set of command payloads carried inside heat-pump frames.
 * @details
 * PURPOSE
 * -------
 * Every master or slave frame carries exactly one command: a one-byte kind code plus a
 * payload of up to 255 bytes. This header defines one small struct per command shape,
 * the `Command` variant that holds any of them, and the two codec entry points:
 *
 *   - decode_command(): kind code + payload bytes -> Command
 *   - encode_payload(): Command -> payload bytes (the kind code comes from command_code())
 *
 * Framing (start marker, address, length byte, checksum, stuffing) is not handled here;
 * see parser.hpp.
 *
 * KIND TABLE
 * ----------
 *   code  struct            payload
 *   ----  ----------------  -----------------------------------------------
 *   0x69  RequestRead       reg:u16                  (empty -> RequestReadNull)
 *   0x6B  RequestWrite      reg:u16 value:u32        (empty -> RequestWriteNull)
 *   0x6A  ResponseRead      reg:u16 value:u32
 *   0x6C  ResponseWrite     reg:u16
 *   0x68  ResponseData      { reg:u16 value:u16 } * n, reg 0xFFFF is padding
 *   0x62  ResponseRmu       opaque bytes from the room unit
 *   0x6D  ResponseProduct   3 opaque bytes + ASCII product name
 *   other CommandUnknown    opaque bytes, code kept
 *
 * All integers are little-endian.
 *
 * NULL REQUESTS
 * -------------
 * The heat pump sends read and write requests with an empty payload as "token" frames
 * (it is offering the bus to an accessory). They are valid traffic, so they decode to
 * RequestReadNull / RequestWriteNull instead of failing the 2- or 6-byte length check.
 *
 * UNKNOWN KINDS
 * -------------
 * Unrecognised codes never fail. They become CommandUnknown with the code and payload
 * kept verbatim, and encode back to the same bytes.
 *
 * STORAGE
 * -------
 * Payload-sized members use ETL fixed-capacity containers. The frame length field is a
 * single byte, so no payload can exceed 255 bytes and the capacities below are exact
 * upper bounds rather than guesses.
 */
#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <variant>
#include <vector>

#include "etl/flat_map.h"
#include "etl/string.h"
#include "etl/vector.h"

namespace pumplink {

static constexpr size_t   MAX_PAYLOAD            = 255;            ///< one-byte length field
static constexpr size_t   MAX_DATA_PARAMS        = MAX_PAYLOAD / 4; ///< 63 groups per bulk frame
static constexpr size_t   MAX_PRODUCT_NAME       = MAX_PAYLOAD - 3;
static constexpr uint16_t DATA_SENTINEL_REGISTER = 0xFFFF;         ///< padding group in 0x68

using PayloadBytes = etl::vector<uint8_t, MAX_PAYLOAD>;
using DataMap      = etl::flat_map<uint16_t, uint16_t, MAX_DATA_PARAMS>;
using ProductName  = etl::string<MAX_PRODUCT_NAME>;

/**
 * @name Command kind codes
 * @brief Second header byte of a frame (after the start marker / address).
 * @{
 */
enum : uint8_t {
    CMD_RESPONSE_RMU     = 0x62,  /**< room unit (RMU40) status blob */
    CMD_RESPONSE_DATA    = 0x68,  /**< bulk register telemetry */
    CMD_REQUEST_READ     = 0x69,  /**< read one register */
    CMD_RESPONSE_READ    = 0x6A,  /**< value of one register */
    CMD_REQUEST_WRITE    = 0x6B,  /**< write one register */
    CMD_RESPONSE_WRITE   = 0x6C,  /**< write acknowledged */
    CMD_RESPONSE_PRODUCT = 0x6D   /**< product identification */
};
/** @} */

/// Outcome of decoding a frame or a command payload.
enum class ParseStatus : uint8_t {
    Ok = 0,
    EmptyPacket,   ///< zero-length datagram
    BadLength,     ///< declared/required length does not match the bytes present
    BadChecksum,   ///< recomputed checksum differs from the trailing byte
    BadPayload,    ///< payload bytes have the right length but invalid content
};

const char* parse_status_name(ParseStatus s);

struct RequestReadNull {
    static constexpr uint8_t code = CMD_REQUEST_READ;
};

struct RequestRead {
    static constexpr uint8_t code = CMD_REQUEST_READ;
    uint16_t reg{0};
};

struct RequestWriteNull {
    static constexpr uint8_t code = CMD_REQUEST_WRITE;
};

struct RequestWrite {
    static constexpr uint8_t code = CMD_REQUEST_WRITE;
    uint16_t reg{0};
    uint32_t value{0};
};

struct ResponseRead {
    static constexpr uint8_t code = CMD_RESPONSE_READ;
    uint16_t reg{0};
    uint32_t value{0};
};

struct ResponseWrite {
    static constexpr uint8_t code = CMD_RESPONSE_WRITE;
    uint16_t reg{0};
};

struct ResponseData {
    static constexpr uint8_t code = CMD_RESPONSE_DATA;
    DataMap parameters;
};

struct ResponseRmu {
    static constexpr uint8_t code = CMD_RESPONSE_RMU;
    PayloadBytes data;
};

struct ResponseProduct {
    static constexpr uint8_t code = CMD_RESPONSE_PRODUCT;
    uint8_t     unknown[3]{0, 0, 0};
    ProductName product;
};

struct CommandUnknown {
    uint8_t      code{0};
    PayloadBytes data;
};

/**
 * @brief Any command. The alternative index is the CommandKind below.
 */
using Command = std::variant<RequestReadNull,
                             RequestRead,
                             RequestWriteNull,
                             RequestWrite,
                             ResponseRead,
                             ResponseWrite,
                             ResponseData,
                             ResponseRmu,
                             ResponseProduct,
                             CommandUnknown>;

/// Discriminant of Command, in variant order.
enum class CommandKind : uint8_t {
    RequestReadNull = 0,
    RequestRead,
    RequestWriteNull,
    RequestWrite,
    ResponseRead,
    ResponseWrite,
    ResponseData,
    ResponseRmu,
    ResponseProduct,
    Unknown,
};

static_assert(std::variant_size<Command>::value == static_cast<size_t>(CommandKind::Unknown) + 1,
              "CommandKind must list every Command alternative");

inline CommandKind kind_of(const Command& c) { return static_cast<CommandKind>(c.index()); }

/// Wire code of @p c (the stored code for CommandUnknown).
uint8_t command_code(const Command& c);

/// Short snake_case name, e.g. "read_request", "data_response".
const char* kind_name(CommandKind k);

/// Read-class commands go to the read port; write-class to the write port.
bool is_read_request(const Command& c);
bool is_write_request(const Command& c);

/**
 * @brief Decode a payload for kind @p code.
 *
 * @param code     Kind byte taken from the frame header.
 * @param payload  Payload bytes (already unstuffed).
 * @param n        Payload length, at most MAX_PAYLOAD.
 * @param out      Receives the command on success; untouched on failure.
 * @param detail   Optional; receives a short reason on failure ("length is not 6: 4").
 */
ParseStatus decode_command(uint8_t code, const uint8_t* payload, size_t n,
                           Command& out, std::string* detail = nullptr);

/// Append the payload bytes of @p c to @p out. Never more than MAX_PAYLOAD bytes.
void encode_payload(const Command& c, std::vector<uint8_t>& out);

/// One-line key=value rendering, e.g. "cmd=read_response reg=40004 value=30".
std::string describe(const Command& c);

bool operator==(const RequestReadNull&, const RequestReadNull&);
bool operator==(const RequestRead& a, const RequestRead& b);
bool operator==(const RequestWriteNull&, const RequestWriteNull&);
bool operator==(const RequestWrite& a, const RequestWrite& b);
bool operator==(const ResponseRead& a, const ResponseRead& b);
bool operator==(const ResponseWrite& a, const ResponseWrite& b);
bool operator==(const ResponseData& a, const ResponseData& b);
bool operator==(const ResponseRmu& a, const ResponseRmu& b);
bool operator==(const ResponseProduct& a, const ResponseProduct& b);
bool operator==(const CommandUnknown& a, const CommandUnknown& b);

// std::variant's operator!= needs these per alternative.
inline bool operator!=(const RequestReadNull& a, const RequestReadNull& b) { return !(a == b); }
inline bool operator!=(const RequestRead& a, const RequestRead& b) { return !(a == b); }
inline bool operator!=(const RequestWriteNull& a, const RequestWriteNull& b) { return !(a == b); }
inline bool operator!=(const RequestWrite& a, const RequestWrite& b) { return !(a == b); }
inline bool operator!=(const ResponseRead& a, const ResponseRead& b) { return !(a == b); }
inline bool operator!=(const ResponseWrite& a, const ResponseWrite& b) { return !(a == b); }
inline bool operator!=(const ResponseData& a, const ResponseData& b) { return !(a == b); }
inline bool operator!=(const ResponseRmu& a, const ResponseRmu& b) { return !(a == b); }
inline bool operator!=(const ResponseProduct& a, const ResponseProduct& b) { return !(a == b); }
inline bool operator!=(const CommandUnknown& a, const CommandUnknown& b) { return !(a == b); }

} // namespace pumplink
