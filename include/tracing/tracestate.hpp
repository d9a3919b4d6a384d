#pragma once

#include "core/error.hpp"

#include <string>
#include <string_view>

namespace tracesdk {

inline constexpr const char* kNoEnvironment = "no environment specified";
inline constexpr const char* kNoRelease = "no release specified";

/**
 * @brief Trace-level metadata propagated in the tracestate header
 *
 * Wire form: base64 of the UTF-16LE JSON text
 *   {"trace_id":..., "public_key":..., "environment":..., "release":...}
 * with the trailing '=' padding run replaced by a single '.', because the
 * tracestate grammar reserves '=' as the key/value separator.
 */
struct TracestateData {
    std::string trace_id;
    std::string public_key;
    std::string environment = kNoEnvironment;
    std::string release = kNoRelease;
};

/// Encode to a header-safe value. ENCODING_ERROR when the fields are not valid UTF-8.
[[nodiscard]] Result<std::string> encode_tracestate(const TracestateData& data);

/**
 * @brief Decode a header value back to its JSON text
 *
 * The trailing '.' is restored to '=' and the value re-padded to a multiple
 * of four, so values that lost one or two padding characters both decode.
 */
[[nodiscard]] Result<std::string> decode_tracestate(std::string_view value);

/// decode_tracestate() followed by JSON parsing into the typed record.
[[nodiscard]] Result<TracestateData> parse_tracestate(std::string_view value);

} // namespace tracesdk
