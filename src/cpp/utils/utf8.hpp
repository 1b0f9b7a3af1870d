#pragma once
// Minimal UTF-8 helpers for repairing double-encoded export text
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chatingest {

// Decodes well-formed UTF-8 into code points, nullopt on any invalid sequence
inline std::optional<std::vector<uint32_t>> utf8_decode(const std::string& s) {
    std::vector<uint32_t> out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        auto b0 = static_cast<uint8_t>(s[i]);
        uint32_t cp = 0;
        size_t len = 0;
        if (b0 < 0x80)                { cp = b0;        len = 1; }
        else if ((b0 & 0xE0) == 0xC0) { cp = b0 & 0x1F; len = 2; }
        else if ((b0 & 0xF0) == 0xE0) { cp = b0 & 0x0F; len = 3; }
        else if ((b0 & 0xF8) == 0xF0) { cp = b0 & 0x07; len = 4; }
        else return std::nullopt;

        if (i + len > s.size()) return std::nullopt;
        for (size_t k = 1; k < len; ++k) {
            auto b = static_cast<uint8_t>(s[i + k]);
            if ((b & 0xC0) != 0x80) return std::nullopt;
            cp = (cp << 6) | (b & 0x3F);
        }

        // Overlong forms, surrogates, out of range
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return std::nullopt;
        }

        out.push_back(cp);
        i += len;
    }
    return out;
}

inline bool utf8_valid(const std::string& s) {
    return utf8_decode(s).has_value();
}

// Text that was UTF-8, misread as Latin-1 and re-encoded as UTF-8 ("Ã©" for "é"):
// narrow every code point back to one byte and re-read as UTF-8. Input that
// does not round-trip (code points above U+00FF, invalid result) is returned as is.
inline std::string repair_latin1_mojibake(const std::string& s) {
    auto cps = utf8_decode(s);
    if (!cps) return s;

    std::string bytes;
    bytes.reserve(cps->size());
    for (uint32_t cp : *cps) {
        if (cp > 0xFF) return s;
        bytes.push_back(static_cast<char>(cp));
    }
    if (!utf8_valid(bytes)) return s;
    return bytes;
}

} // namespace chatingest
