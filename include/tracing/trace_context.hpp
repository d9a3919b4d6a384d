#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace tracesdk {

/**
 * @brief Data carried by an upstream trace-parent header
 *
 * Format: "{trace_id}-{span_id}[-{sampled}]"
 *   trace_id: 32 lowercase hex chars (128-bit)
 *   span_id:  16 lowercase hex chars (64-bit), becomes our parent span id
 *   sampled:  optional "1" or "0"
 */
struct TraceparentData {
    std::string trace_id;
    std::string parent_span_id;
    std::optional<bool> parent_sampled;
};

/// Parse a trace-parent header value. Any deviation from the grammar yields std::nullopt.
[[nodiscard]] std::optional<TraceparentData> extract_traceparent_data(std::string_view header);

/// Serialize to a trace-parent header value; the third segment is present only when sampled is set.
[[nodiscard]] std::string to_traceparent(std::string_view trace_id,
                                         std::string_view span_id,
                                         std::optional<bool> sampled);

/// Generate a random 16-hex-char span ID
[[nodiscard]] std::string generate_span_id();

/// Generate a random 32-hex-char trace ID
[[nodiscard]] std::string generate_trace_id();

} // namespace tracesdk
