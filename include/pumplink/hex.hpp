#pragma once
/**
 * @file hex.hpp
 * @brief Hex dump and hex parsing helpers for frames.
 *
 * Frames are logged, printed by the CLI and written in tests as space separated
 * uppercase hex ("5C 00 20 6B 00 4B"). from_hex() accepts that form as well as
 * contiguous digits ("5c00206b004b") and either case.
 */

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace pumplink {

/// "5C 00 20" style dump. Empty input gives an empty string.
std::string to_hex(const uint8_t* data, size_t n, char sep = ' ');

inline std::string to_hex(const std::vector<uint8_t>& data, char sep = ' ') {
    return to_hex(data.data(), data.size(), sep);
}

/**
 * @brief Parse hex text into bytes.
 *
 * Whitespace, ':' and ',' between bytes are ignored. A "0x" prefix on a byte is
 * accepted.
 *
 * @return false on a non-hex character or an odd number of digits in a group;
 *         @p out is left empty in that case.
 */
bool from_hex(const std::string& text, std::vector<uint8_t>& out);

} // namespace pumplink
