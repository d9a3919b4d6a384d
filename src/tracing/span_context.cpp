#include "tracing/span_context.hpp"
#include "tracing/trace_context.hpp"

namespace tracesdk {

const char* span_status_name(SpanStatus status) {
    switch (status) {
        case SpanStatus::OK:                  return "ok";
        case SpanStatus::CANCELLED:           return "cancelled";
        case SpanStatus::UNKNOWN_ERROR:       return "unknown_error";
        case SpanStatus::INVALID_ARGUMENT:    return "invalid_argument";
        case SpanStatus::DEADLINE_EXCEEDED:   return "deadline_exceeded";
        case SpanStatus::NOT_FOUND:           return "not_found";
        case SpanStatus::ALREADY_EXISTS:      return "already_exists";
        case SpanStatus::PERMISSION_DENIED:   return "permission_denied";
        case SpanStatus::RESOURCE_EXHAUSTED:  return "resource_exhausted";
        case SpanStatus::FAILED_PRECONDITION: return "failed_precondition";
        case SpanStatus::ABORTED:             return "aborted";
        case SpanStatus::OUT_OF_RANGE:        return "out_of_range";
        case SpanStatus::UNIMPLEMENTED:       return "unimplemented";
        case SpanStatus::INTERNAL_ERROR:      return "internal_error";
        case SpanStatus::UNAVAILABLE:         return "unavailable";
        case SpanStatus::DATA_LOSS:           return "data_loss";
        case SpanStatus::UNAUTHENTICATED:     return "unauthenticated";
    }
    return "unknown_error";
}

SpanStatus span_status_from_http_code(int http_status) {
    if (http_status < 400 && http_status >= 100) {
        return SpanStatus::OK;
    }

    if (http_status >= 400 && http_status < 500) {
        switch (http_status) {
            case 401: return SpanStatus::UNAUTHENTICATED;
            case 403: return SpanStatus::PERMISSION_DENIED;
            case 404: return SpanStatus::NOT_FOUND;
            case 409: return SpanStatus::ALREADY_EXISTS;
            case 413: return SpanStatus::FAILED_PRECONDITION;
            case 429: return SpanStatus::RESOURCE_EXHAUSTED;
            default:  return SpanStatus::INVALID_ARGUMENT;
        }
    }

    if (http_status >= 500 && http_status < 600) {
        switch (http_status) {
            case 501: return SpanStatus::UNIMPLEMENTED;
            case 503: return SpanStatus::UNAVAILABLE;
            case 504: return SpanStatus::DEADLINE_EXCEEDED;
            default:  return SpanStatus::INTERNAL_ERROR;
        }
    }

    return SpanStatus::UNKNOWN_ERROR;
}

std::optional<TransactionContext> continue_from_traceparent(
    std::string_view traceparent, TransactionContext base) {
    auto data = extract_traceparent_data(traceparent);
    if (!data) return std::nullopt;

    base.trace_id = std::move(data->trace_id);
    base.parent_span_id = std::move(data->parent_span_id);
    base.parent_sampled = data->parent_sampled;
    return base;
}

} // namespace tracesdk
