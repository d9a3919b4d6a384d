#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tracesdk::base64 {

inline std::string encode(const uint8_t* data, size_t len) {
    static const char kChars[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string result;
    result.reserve(4 * ((len + 2) / 3));

    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < len) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < len) n |= static_cast<uint32_t>(data[i + 2]);

        result += kChars[(n >> 18) & 0x3F];
        result += kChars[(n >> 12) & 0x3F];
        result += (i + 1 < len) ? kChars[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < len) ? kChars[n & 0x3F] : '=';
    }
    return result;
}

inline std::string encode(const std::vector<uint8_t>& data) {
    return encode(data.data(), data.size());
}

namespace detail {

inline uint8_t lookup(char c) {
    static const uint8_t kTable[128] = {
        64,64,64,64,64,64,64,64,64,64,64,64,64,64,64,64,
        64,64,64,64,64,64,64,64,64,64,64,64,64,64,64,64,
        64,64,64,64,64,64,64,64,64,64,64,62,64,64,64,63,
        52,53,54,55,56,57,58,59,60,61,64,64,64,64,64,64,
        64, 0, 1, 2, 3, 4, 5, 6, 7, 8, 9,10,11,12,13,14,
        15,16,17,18,19,20,21,22,23,24,25,64,64,64,64,64,
        64,26,27,28,29,30,31,32,33,34,35,36,37,38,39,40,
        41,42,43,44,45,46,47,48,49,50,51,64,64,64,64,64
    };
    const auto uc = static_cast<unsigned char>(c);
    return uc < 128 ? kTable[uc] : 64;
}

} // namespace detail

/// Lenient decode: skips padding, line breaks and foreign characters.
inline std::vector<uint8_t> decode(std::string_view encoded) {
    std::vector<uint8_t> result;
    result.reserve(3 * encoded.size() / 4);

    uint32_t buf = 0;
    int bits = 0;
    for (const char c : encoded) {
        if (c == '=' || c == '\n' || c == '\r') continue;
        const uint8_t val = detail::lookup(c);
        if (val == 64) continue;

        buf = (buf << 6) | val;
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<uint8_t>((buf >> bits) & 0xFF));
        }
    }
    return result;
}

/**
 * @brief Check canonical padded base64: length a multiple of four, only the
 * standard alphabet, and at most two '=' characters at the very end.
 */
[[nodiscard]] inline bool is_valid(std::string_view encoded) {
    if (encoded.size() % 4 != 0) return false;

    size_t padding = 0;
    while (padding < encoded.size() && padding < 3 &&
           encoded[encoded.size() - 1 - padding] == '=') {
        ++padding;
    }
    if (padding > 2) return false;

    for (size_t i = 0; i < encoded.size() - padding; ++i) {
        if (detail::lookup(encoded[i]) == 64) return false;
    }
    return true;
}

/// Strict decode: std::nullopt unless the input passes is_valid().
[[nodiscard]] inline std::optional<std::vector<uint8_t>> decode_strict(std::string_view encoded) {
    if (!is_valid(encoded)) return std::nullopt;
    return decode(encoded);
}

} // namespace tracesdk::base64
