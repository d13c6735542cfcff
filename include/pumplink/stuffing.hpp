#pragma once

/**
 * @page pl-stuffing pumplink Byte Stuffing
 * @file stuffing.hpp
 * @brief Escape/unescape of the frame start marker inside a heat-pump frame.
 *
 * @details
 * OVERVIEW
 * --------
 * Frames on the heat-pump link begin with a start marker: 0x5C for frames sent by the
 * master (the heat pump) and 0xC0 for frames sent by a slave (an accessory). The marker
 * must never appear bare inside the frame body, otherwise a receiver resynchronising on
 * the byte stream would mistake it for the start of a new frame.
 *
 * The protocol solves this with the simplest possible stuffing rule: every literal
 * marker byte after the first byte of the frame is doubled.
 *
 * RULES
 * -----
 * Escaping (sender side):
 *   - The first byte is the start marker itself and is copied through unchanged.
 *   - Every later byte equal to @p key is emitted twice.
 *   - All other bytes are copied through.
 *
 * Unescaping (receiver side):
 *   - The first byte is copied through unchanged.
 *   - When a later byte equals @p key it is dropped and the byte after it is taken as
 *     the real data byte (whatever its value).
 *   - A stream that ends exactly on a @p key byte stops there without error. The
 *     output is then shorter than the frame claims and the length check in the
 *     frame parser rejects it.
 *
 * EXAMPLES
 * --------
 * @code
 *   // slave frame whose register low byte is 0xC0
 *   std::vector<uint8_t> raw = {0xC0, 0x6B, 0x06, 0xC0, 0, 0, 0, 0, 0, 0x6D};
 *   auto wire = pumplink::stuffing::escape(raw, 0xC0);
 *   // wire: C0 6B 06 C0 C0 00 00 00 00 00 6D
 *   auto back = pumplink::stuffing::unescape(wire, 0xC0);
 *   // back == raw
 * @endcode
 *
 * NOTES
 * -----
 * - Stateless free functions; the caller owns the output vectors.
 * - The escape output reserves worst case capacity (2x input) up front.
 */

#include <vector>
#include <cstdint>
#include <cstddef>

namespace pumplink {
namespace stuffing {

/**
 * @brief Double every @p key byte after the first byte of @p in.
 *
 * @param in   First byte of the unescaped frame.
 * @param n    Number of bytes at @p in.
 * @param key  Reserved byte value (the frame start marker).
 * @param out  Receives the escaped frame. Cleared first.
 */
inline void escape(const uint8_t* in, size_t n, uint8_t key, std::vector<uint8_t>& out) {
    out.clear();
    if (n == 0) return;
    out.reserve(n * 2);

    out.push_back(in[0]);               // start marker is never stuffed

    for (size_t i = 1; i < n; ++i) {
        if (in[i] == key) out.push_back(key);
        out.push_back(in[i]);
    }
}

/**
 * @brief Reverse of escape(): drop each @p key byte and keep the byte that follows it.
 *
 * @param in   First byte of the escaped stream.
 * @param n    Number of bytes at @p in.
 * @param key  Reserved byte value (the frame start marker).
 * @param out  Receives the original frame. Cleared first.
 *
 * A trailing lone @p key byte is silently discarded.
 */
inline void unescape(const uint8_t* in, size_t n, uint8_t key, std::vector<uint8_t>& out) {
    out.clear();
    if (n == 0) return;
    out.reserve(n);

    out.push_back(in[0]);

    for (size_t i = 1; i < n; ++i) {
        uint8_t b = in[i];
        if (b == key) {
            if (++i >= n) return;       // truncated: marker with nothing after it
            b = in[i];
        }
        out.push_back(b);
    }
}

inline std::vector<uint8_t> escape(const std::vector<uint8_t>& in, uint8_t key) {
    std::vector<uint8_t> out;
    escape(in.data(), in.size(), key, out);
    return out;
}

inline std::vector<uint8_t> unescape(const std::vector<uint8_t>& in, uint8_t key) {
    std::vector<uint8_t> out;
    unescape(in.data(), in.size(), key, out);
    return out;
}

} // namespace stuffing
} // namespace pumplink
