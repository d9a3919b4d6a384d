#pragma once

#include <nlohmann/json.hpp>

#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace tracesdk {

/**
 * @brief Outcome of the work a span measured
 */
enum class SpanStatus {
    OK,
    CANCELLED,
    UNKNOWN_ERROR,
    INVALID_ARGUMENT,
    DEADLINE_EXCEEDED,
    NOT_FOUND,
    ALREADY_EXISTS,
    PERMISSION_DENIED,
    RESOURCE_EXHAUSTED,
    FAILED_PRECONDITION,
    ABORTED,
    OUT_OF_RANGE,
    UNIMPLEMENTED,
    INTERNAL_ERROR,
    UNAVAILABLE,
    DATA_LOSS,
    UNAUTHENTICATED
};

[[nodiscard]] const char* span_status_name(SpanStatus status);

/// Map an HTTP response code to the closest span status.
[[nodiscard]] SpanStatus span_status_from_http_code(int http_status);

using TagMap = std::map<std::string, std::string>;

/**
 * @brief Identity and metadata a span is created with
 *
 * Empty trace_id/span_id are generated when the span is constructed.
 */
struct SpanContext {
    std::string trace_id;
    std::string span_id;
    std::optional<std::string> parent_span_id;
    std::optional<bool> sampled;
    std::string op;
    std::string description;
    TagMap tags;
    nlohmann::json data = nlohmann::json::object();
    std::optional<SpanStatus> status;
    std::optional<double> start_timestamp;
};

/**
 * @brief Context for starting a transaction (the root span of a trace)
 */
struct TransactionContext : SpanContext {
    std::string name;
    std::optional<bool> parent_sampled;
    std::optional<std::string> tracestate;  // inherited from an upstream caller
    bool trim_end = false;
};

/**
 * @brief Continue an upstream trace from its trace-parent header
 *
 * Fills trace_id, parent_span_id and parent_sampled of `base` from the
 * header. Returns std::nullopt when the header is malformed.
 */
[[nodiscard]] std::optional<TransactionContext> continue_from_traceparent(
    std::string_view traceparent, TransactionContext base = {});

} // namespace tracesdk
