#include "tracing/span_recorder.hpp"
#include "core/utils.hpp"
#include "tracing/span.hpp"

namespace tracesdk {

SpanRecorder::SpanRecorder(size_t maxlen)
    : maxlen_(maxlen) {}

bool SpanRecorder::add(const std::shared_ptr<Span>& span) {
    if (!span) return false;

    if (is_dropping()) {
        if (dropped_count_ == 0) {
            utils::log::debug("[Tracing] Span recorder reached its limit of " +
                std::to_string(maxlen_) + " spans, dropping further spans");
        }
        span->recorder_.reset();
        ++dropped_count_;
        return false;
    }

    spans_.push_back(span);
    return true;
}

} // namespace tracesdk
