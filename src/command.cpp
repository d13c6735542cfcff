// ============================================================================
// command.cpp: implementation for command.hpp
// For the kind table and payload layouts see the matching .hpp.
// ============================================================================

#include "pumplink/command.hpp"

#include <sstream>
#include <type_traits>

namespace pumplink {

// ============================================================================
// Little-endian helpers
// ============================================================================

static inline uint16_t get_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

static inline uint32_t get_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0])
         | (static_cast<uint32_t>(p[1]) << 8)
         | (static_cast<uint32_t>(p[2]) << 16)
         | (static_cast<uint32_t>(p[3]) << 24);
}

static inline void put_u16(std::vector<uint8_t>& b, uint16_t v) {
    b.push_back(static_cast<uint8_t>(v & 0xFF));
    b.push_back(static_cast<uint8_t>(v >> 8));
}

static inline void put_u32(std::vector<uint8_t>& b, uint32_t v) {
    b.push_back(static_cast<uint8_t>(v & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    b.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
}

static ParseStatus length_error(const char* what, size_t n, std::string* detail) {
    if (detail) {
        std::ostringstream os;
        os << what << ": " << n;
        *detail = os.str();
    }
    return ParseStatus::BadLength;
}

// ============================================================================
// Names
// ============================================================================

const char* parse_status_name(ParseStatus s) {
    switch (s) {
        case ParseStatus::Ok:          return "ok";
        case ParseStatus::EmptyPacket: return "empty_packet";
        case ParseStatus::BadLength:   return "bad_length";
        case ParseStatus::BadChecksum: return "bad_checksum";
        case ParseStatus::BadPayload:  return "bad_payload";
    }
    return "unknown";
}

const char* kind_name(CommandKind k) {
    switch (k) {
        case CommandKind::RequestReadNull:  return "read_request_null";
        case CommandKind::RequestRead:      return "read_request";
        case CommandKind::RequestWriteNull: return "write_request_null";
        case CommandKind::RequestWrite:     return "write_request";
        case CommandKind::ResponseRead:     return "read_response";
        case CommandKind::ResponseWrite:    return "write_response";
        case CommandKind::ResponseData:     return "data_response";
        case CommandKind::ResponseRmu:      return "rmu_response";
        case CommandKind::ResponseProduct:  return "product_response";
        case CommandKind::Unknown:          return "unknown";
    }
    return "unknown";
}

uint8_t command_code(const Command& c) {
    return std::visit([](const auto& cmd) -> uint8_t {
        using T = std::decay_t<decltype(cmd)>;
        if constexpr (std::is_same_v<T, CommandUnknown>) return cmd.code;
        else return T::code;
    }, c);
}

bool is_read_request(const Command& c) {
    return std::holds_alternative<RequestRead>(c) || std::holds_alternative<RequestReadNull>(c);
}

bool is_write_request(const Command& c) {
    return std::holds_alternative<RequestWrite>(c) || std::holds_alternative<RequestWriteNull>(c);
}

// ============================================================================
// Decode
// ============================================================================
// One branch per kind code. Each branch validates the exact length its layout
// needs and only then touches `out`, so a failed decode leaves it unchanged.

ParseStatus decode_command(uint8_t code, const uint8_t* payload, size_t n,
                           Command& out, std::string* detail) {
    switch (code) {
    case CMD_REQUEST_READ:
        if (n == 0) { out = RequestReadNull{}; return ParseStatus::Ok; }
        if (n != 2) return length_error("length is not 2", n, detail);
        out = RequestRead{get_u16(payload)};
        return ParseStatus::Ok;

    case CMD_REQUEST_WRITE:
        if (n == 0) { out = RequestWriteNull{}; return ParseStatus::Ok; }
        if (n != 6) return length_error("length is not 6", n, detail);
        out = RequestWrite{get_u16(payload), get_u32(payload + 2)};
        return ParseStatus::Ok;

    case CMD_RESPONSE_READ:
        if (n != 6) return length_error("length is not 6", n, detail);
        out = ResponseRead{get_u16(payload), get_u32(payload + 2)};
        return ParseStatus::Ok;

    case CMD_RESPONSE_WRITE:
        if (n != 2) return length_error("length is not 2", n, detail);
        out = ResponseWrite{get_u16(payload)};
        return ParseStatus::Ok;

    case CMD_RESPONSE_DATA: {
        if (n % 4) return length_error("length is not a multiple of 4", n, detail);
        ResponseData data;
        for (size_t i = 0; i < n; i += 4) {
            uint16_t reg = get_u16(payload + i);
            if (reg == DATA_SENTINEL_REGISTER) continue;   // padding group
            data.parameters[reg] = get_u16(payload + i + 2);
        }
        out = std::move(data);
        return ParseStatus::Ok;
    }

    case CMD_RESPONSE_RMU: {
        ResponseRmu rmu;
        rmu.data.assign(payload, payload + n);
        out = std::move(rmu);
        return ParseStatus::Ok;
    }

    case CMD_RESPONSE_PRODUCT: {
        if (n < 3) return length_error("length is below 3", n, detail);
        ResponseProduct product;
        for (size_t i = 0; i < 3; ++i) product.unknown[i] = payload[i];
        for (size_t i = 3; i < n; ++i) {
            if (payload[i] > 0x7F) {
                if (detail) *detail = "product name is not ascii";
                return ParseStatus::BadPayload;
            }
            product.product.push_back(static_cast<char>(payload[i]));
        }
        out = std::move(product);
        return ParseStatus::Ok;
    }

    default: {
        CommandUnknown unknown;
        unknown.code = code;
        unknown.data.assign(payload, payload + n);
        out = std::move(unknown);
        return ParseStatus::Ok;
    }
    }
}

// ============================================================================
// Encode
// ============================================================================

namespace {

struct PayloadEncoder {
    std::vector<uint8_t>& b;

    void operator()(const RequestReadNull&) const {}
    void operator()(const RequestWriteNull&) const {}
    void operator()(const RequestRead& c) const { put_u16(b, c.reg); }
    void operator()(const RequestWrite& c) const { put_u16(b, c.reg); put_u32(b, c.value); }
    void operator()(const ResponseRead& c) const { put_u16(b, c.reg); put_u32(b, c.value); }
    void operator()(const ResponseWrite& c) const { put_u16(b, c.reg); }

    void operator()(const ResponseData& c) const {
        for (const auto& kv : c.parameters) {
            if (kv.first == DATA_SENTINEL_REGISTER) continue;   // padding, never on the wire
            put_u16(b, kv.first);
            put_u16(b, kv.second);
        }
    }

    void operator()(const ResponseRmu& c) const { b.insert(b.end(), c.data.begin(), c.data.end()); }

    void operator()(const ResponseProduct& c) const {
        b.insert(b.end(), c.unknown, c.unknown + 3);
        b.insert(b.end(), c.product.begin(), c.product.end());
    }

    void operator()(const CommandUnknown& c) const { b.insert(b.end(), c.data.begin(), c.data.end()); }
};

} // namespace

void encode_payload(const Command& c, std::vector<uint8_t>& out) {
    std::visit(PayloadEncoder{out}, c);
}

// ============================================================================
// Pretty
// ============================================================================

namespace {

struct Describer {
    std::ostringstream& os;

    void operator()(const RequestReadNull&) const {}
    void operator()(const RequestWriteNull&) const {}
    void operator()(const RequestRead& c) const { os << " reg=" << c.reg; }
    void operator()(const RequestWrite& c) const { os << " reg=" << c.reg << " value=" << c.value; }
    void operator()(const ResponseRead& c) const { os << " reg=" << c.reg << " value=" << c.value; }
    void operator()(const ResponseWrite& c) const { os << " reg=" << c.reg; }

    void operator()(const ResponseData& c) const {
        os << " count=" << c.parameters.size();
        for (const auto& kv : c.parameters) os << ' ' << kv.first << '=' << kv.second;
    }

    void operator()(const ResponseRmu& c) const { os << " bytes=" << c.data.size(); }

    void operator()(const ResponseProduct& c) const {
        os << " product=\"" << std::string(c.product.begin(), c.product.end()) << '"';
    }

    void operator()(const CommandUnknown& c) const {
        os << " code=0x" << std::hex << static_cast<int>(c.code) << std::dec
           << " bytes=" << c.data.size();
    }
};

} // namespace

std::string describe(const Command& c) {
    std::ostringstream os;
    os << "cmd=" << kind_name(kind_of(c));
    std::visit(Describer{os}, c);
    return os.str();
}

// ============================================================================
// Equality
// ============================================================================

bool operator==(const RequestReadNull&, const RequestReadNull&)   { return true; }
bool operator==(const RequestWriteNull&, const RequestWriteNull&) { return true; }

bool operator==(const RequestRead& a, const RequestRead& b)     { return a.reg == b.reg; }
bool operator==(const ResponseWrite& a, const ResponseWrite& b) { return a.reg == b.reg; }

bool operator==(const RequestWrite& a, const RequestWrite& b) {
    return a.reg == b.reg && a.value == b.value;
}

bool operator==(const ResponseRead& a, const ResponseRead& b) {
    return a.reg == b.reg && a.value == b.value;
}

bool operator==(const ResponseData& a, const ResponseData& b) { return a.parameters == b.parameters; }
bool operator==(const ResponseRmu& a, const ResponseRmu& b)   { return a.data == b.data; }

bool operator==(const ResponseProduct& a, const ResponseProduct& b) {
    return a.unknown[0] == b.unknown[0] && a.unknown[1] == b.unknown[1]
        && a.unknown[2] == b.unknown[2] && a.product == b.product;
}

bool operator==(const CommandUnknown& a, const CommandUnknown& b) {
    return a.code == b.code && a.data == b.data;
}

} // namespace pumplink
