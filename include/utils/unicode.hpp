/**
 * @file unicode.hpp
 * @brief UTF-8 validation for text entering the graph
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace Databrain {

/**
 * @brief Strict UTF-8 check.
 *
 * Rejects stray continuation bytes, truncated sequences, overlong forms,
 * UTF-16 surrogates (U+D800..U+DFFF) and code points above U+10FFFF.
 */
inline bool is_valid_utf8(std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        uint8_t c = static_cast<uint8_t>(s[i]);
        if (c < 0x80) { ++i; continue; }

        size_t len = 0;
        char32_t cp = 0;
        char32_t min_cp = 0;

        if ((c >> 5) == 0x6)       { len = 2; cp = c & 0x1F; min_cp = 0x80; }
        else if ((c >> 4) == 0xE)  { len = 3; cp = c & 0x0F; min_cp = 0x800; }
        else if ((c >> 3) == 0x1E) { len = 4; cp = c & 0x07; min_cp = 0x10000; }
        else return false;  // continuation byte or 0xF8..0xFF

        if (i + len > s.size()) return false;

        for (size_t j = 1; j < len; ++j) {
            uint8_t cc = static_cast<uint8_t>(s[i + j]);
            if ((cc >> 6) != 0x2) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }

        if (cp < min_cp) return false;
        if (cp >= 0xD800 && cp <= 0xDFFF) return false;
        if (cp > 0x10FFFF) return false;

        i += len;
    }
    return true;
}

} // namespace Databrain
