#pragma once
/**
 * @file checksum.hpp
 * @brief XOR frame checksum with start-marker substitution.
 *
 * The checksum is the XOR of every byte in the covered span. A checksum equal to the
 * frame's start marker would look like the beginning of a new frame, so in that one
 * case the nibble-swapped marker is sent instead:
 *
 *   0x5C -> 0xC5   (master frames)
 *   0xC0 -> 0x0C   (slave frames)
 *
 * Both the encoder and the parser call checksum(), so the substitution is applied
 * symmetrically.
 *
 * Covered span:
 *   - master frame: from the address byte up to the end of the payload
 *     (the leading "5C 00" is excluded),
 *   - slave frame:  from the start marker up to the end of the payload.
 */

#include <cstdint>
#include <cstddef>

namespace pumplink {

/// Nibble-swapped value used when the raw XOR collides with @p key.
constexpr uint8_t checksum_substitute(uint8_t key) {
    return static_cast<uint8_t>(((key << 4) | (key >> 4)) & 0xFF);
}

inline uint8_t checksum(const uint8_t* data, size_t n, uint8_t key) {
    uint8_t result = 0;
    for (size_t i = 0; i < n; ++i) result ^= data[i];
    if (result == key) result = checksum_substitute(key);
    return result;
}

} // namespace pumplink
