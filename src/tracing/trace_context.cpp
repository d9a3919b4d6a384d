#include "tracing/trace_context.hpp"
#include "core/utils.hpp"

namespace tracesdk {

namespace {

constexpr size_t kTraceIdLength = 32;
constexpr size_t kSpanIdLength = 16;

} // anonymous namespace

std::optional<TraceparentData> extract_traceparent_data(std::string_view header) {
    // "TTTTTTTTTTTTTTTTTTTTTTTTTTTTTTTT-SSSSSSSSSSSSSSSS[-F]"
    // Lengths: 32 + 1 + 16 = 49, or 51 with the sampled flag
    constexpr size_t kBaseLength = kTraceIdLength + 1 + kSpanIdLength;

    if (header.size() != kBaseLength && header.size() != kBaseLength + 2) {
        return std::nullopt;
    }
    if (header[kTraceIdLength] != '-') return std::nullopt;

    const auto trace_id = header.substr(0, kTraceIdLength);
    const auto span_id = header.substr(kTraceIdLength + 1, kSpanIdLength);
    if (!utils::is_lower_hex(trace_id) || !utils::is_lower_hex(span_id)) {
        return std::nullopt;
    }

    TraceparentData data;
    data.trace_id = std::string(trace_id);
    data.parent_span_id = std::string(span_id);

    if (header.size() == kBaseLength + 2) {
        if (header[kBaseLength] != '-') return std::nullopt;
        const char flag = header[kBaseLength + 1];
        if (flag == '1') {
            data.parent_sampled = true;
        } else if (flag == '0') {
            data.parent_sampled = false;
        } else {
            return std::nullopt;
        }
    }

    return data;
}

std::string to_traceparent(std::string_view trace_id,
                           std::string_view span_id,
                           std::optional<bool> sampled) {
    std::string header;
    header.reserve(kTraceIdLength + kSpanIdLength + 3);
    header.append(trace_id);
    header += '-';
    header.append(span_id);
    if (sampled.has_value()) {
        header += *sampled ? "-1" : "-0";
    }
    return header;
}

std::string generate_span_id() {
    return utils::random_hex(kSpanIdLength / 2);
}

std::string generate_trace_id() {
    return utils::random_hex(kTraceIdLength / 2);
}

} // namespace tracesdk
