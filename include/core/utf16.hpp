#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tracesdk::utf16 {

/**
 * @brief Convert UTF-8 text to UTF-16 little-endian bytes
 *
 * Other SDKs base64-encode the UTF-16LE form of header payloads, so this is
 * the byte form fed to base64::encode. Returns std::nullopt on malformed
 * UTF-8 (truncated sequences, stray continuation bytes, overlong forms,
 * encoded surrogates, code points above U+10FFFF).
 */
[[nodiscard]] inline std::optional<std::vector<uint8_t>> from_utf8(std::string_view text) {
    std::vector<uint8_t> out;
    out.reserve(text.size() * 2);

    auto push_unit = [&out](uint16_t unit) {
        out.push_back(static_cast<uint8_t>(unit & 0xFF));
        out.push_back(static_cast<uint8_t>(unit >> 8));
    };

    size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        uint32_t cp = 0;
        size_t extra = 0;
        uint32_t min_cp = 0;

        if (lead < 0x80) {
            cp = lead;
        } else if ((lead & 0xE0) == 0xC0) {
            cp = lead & 0x1F; extra = 1; min_cp = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            cp = lead & 0x0F; extra = 2; min_cp = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            cp = lead & 0x07; extra = 3; min_cp = 0x10000;
        } else {
            return std::nullopt;
        }

        if (i + extra >= text.size()) return std::nullopt;
        for (size_t k = 1; k <= extra; ++k) {
            const auto cont = static_cast<unsigned char>(text[i + k]);
            if ((cont & 0xC0) != 0x80) return std::nullopt;
            cp = (cp << 6) | (cont & 0x3F);
        }
        if (extra > 0 && cp < min_cp) return std::nullopt;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) return std::nullopt;

        if (cp >= 0x10000) {
            const uint32_t v = cp - 0x10000;
            push_unit(static_cast<uint16_t>(0xD800 + (v >> 10)));
            push_unit(static_cast<uint16_t>(0xDC00 + (v & 0x3FF)));
        } else {
            push_unit(static_cast<uint16_t>(cp));
        }
        i += extra + 1;
    }
    return out;
}

/**
 * @brief Convert UTF-16 little-endian bytes back to UTF-8 text
 *
 * Returns std::nullopt for an odd byte count or unpaired surrogates.
 */
[[nodiscard]] inline std::optional<std::string> to_utf8(const std::vector<uint8_t>& bytes) {
    if (bytes.size() % 2 != 0) return std::nullopt;

    std::string out;
    out.reserve(bytes.size() / 2);

    auto append = [&out](uint32_t cp) {
        if (cp < 0x80) {
            out += static_cast<char>(cp);
        } else if (cp < 0x800) {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else if (cp < 0x10000) {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        } else {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    };

    const size_t units = bytes.size() / 2;
    auto unit_at = [&bytes](size_t idx) {
        return static_cast<uint16_t>(bytes[idx * 2] | (bytes[idx * 2 + 1] << 8));
    };

    for (size_t i = 0; i < units; ++i) {
        const uint16_t unit = unit_at(i);
        if (unit >= 0xD800 && unit <= 0xDBFF) {
            if (i + 1 >= units) return std::nullopt;
            const uint16_t low = unit_at(i + 1);
            if (low < 0xDC00 || low > 0xDFFF) return std::nullopt;
            append(0x10000 + ((static_cast<uint32_t>(unit - 0xD800) << 10) | (low - 0xDC00)));
            ++i;
        } else if (unit >= 0xDC00 && unit <= 0xDFFF) {
            return std::nullopt;
        } else {
            append(unit);
        }
    }
    return out;
}

} // namespace tracesdk::utf16
