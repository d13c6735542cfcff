#include "pumplink/hex.hpp"

namespace pumplink {

static const char HEX_DIGITS[] = "0123456789ABCDEF";

static int nibble(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static bool is_separator(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == ':' || c == ',';
}

std::string to_hex(const uint8_t* data, size_t n, char sep) {
    std::string s;
    if (n == 0) return s;
    s.reserve(n * 3);
    for (size_t i = 0; i < n; ++i) {
        if (i && sep) s.push_back(sep);
        s.push_back(HEX_DIGITS[data[i] >> 4]);
        s.push_back(HEX_DIGITS[data[i] & 0x0F]);
    }
    return s;
}

bool from_hex(const std::string& text, std::vector<uint8_t>& out) {
    out.clear();
    size_t i = 0;
    while (i < text.size()) {
        if (is_separator(text[i])) { ++i; continue; }

        // one group of digits up to the next separator
        size_t j = i;
        while (j < text.size() && !is_separator(text[j])) ++j;

        size_t k = i;
        if (j - i > 2 && text[i] == '0' && (text[i + 1] == 'x' || text[i + 1] == 'X')) k += 2;
        if ((j - k) % 2 != 0 || j == k) { out.clear(); return false; }

        for (; k < j; k += 2) {
            int hi = nibble(text[k]);
            int lo = nibble(text[k + 1]);
            if (hi < 0 || lo < 0) { out.clear(); return false; }
            out.push_back(static_cast<uint8_t>((hi << 4) | lo));
        }
        i = j;
    }
    return true;
}

} // namespace pumplink
