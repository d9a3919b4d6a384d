#include "tracing/span.hpp"
#include "core/utils.hpp"
#include "tracing/span_recorder.hpp"
#include "tracing/trace_context.hpp"
#include "tracing/transaction.hpp"

namespace tracesdk {

Span::Span(SpanContext context)
    : trace_id_(std::move(context.trace_id)),
      span_id_(std::move(context.span_id)),
      parent_span_id_(std::move(context.parent_span_id)),
      sampled_(context.sampled),
      op_(std::move(context.op)),
      description_(std::move(context.description)),
      tags_(std::move(context.tags)),
      data_(std::move(context.data)),
      status_(context.status),
      start_timestamp_(context.start_timestamp.value_or(utils::timestamp_in_seconds())) {
    if (trace_id_.empty()) trace_id_ = generate_trace_id();
    if (span_id_.empty()) span_id_ = generate_span_id();
    if (!data_.is_object()) data_ = nlohmann::json::object();
}

std::shared_ptr<Span> Span::start_child(SpanContext context) {
    // Identity and sampling are inherited, never taken from the caller
    context.trace_id = trace_id_;
    context.span_id.clear();
    context.parent_span_id = span_id_;
    context.sampled = sampled_;

    auto child = std::make_shared<Span>(std::move(context));
    child->transaction_ = transaction_;

    if (auto recorder = recorder_.lock()) {
        child->recorder_ = recorder;
        (void)recorder->add(child);
    }

    return child;
}

void Span::finish(std::optional<double> end_timestamp) {
    if (auto tx = transaction_.lock(); tx && tx->span().get() == this) {
        (void)tx->finish(end_timestamp);
        return;
    }
    (void)close(end_timestamp);
}

bool Span::close(std::optional<double> end_timestamp) {
    if (end_timestamp_.has_value()) return false;
    end_timestamp_ = end_timestamp.value_or(utils::timestamp_in_seconds());
    return true;
}

void Span::set_tag(const std::string& key, const std::string& value) {
    tags_[key] = value;
}

void Span::set_data(const std::string& key, nlohmann::json value) {
    data_[key] = std::move(value);
}

void Span::set_http_status(int http_status) {
    set_tag("http.status_code", std::to_string(http_status));
    const SpanStatus status = span_status_from_http_code(http_status);
    if (status != SpanStatus::UNKNOWN_ERROR) {
        set_status(status);
    }
}

bool Span::is_success() const {
    return !status_.has_value() || *status_ == SpanStatus::OK;
}

std::string Span::to_traceparent() const {
    return tracesdk::to_traceparent(trace_id_, span_id_, sampled_);
}

nlohmann::json Span::get_trace_context() const {
    nlohmann::json j;
    if (!data_.empty()) j["data"] = data_;
    if (!description_.empty()) j["description"] = description_;
    if (!op_.empty()) j["op"] = op_;
    if (parent_span_id_) j["parent_span_id"] = *parent_span_id_;
    j["span_id"] = span_id_;
    if (status_) j["status"] = span_status_name(*status_);
    if (!tags_.empty()) j["tags"] = tags_;
    j["trace_id"] = trace_id_;
    return j;
}

nlohmann::json Span::to_json() const {
    nlohmann::json j;
    if (!data_.empty()) j["data"] = data_;
    if (!description_.empty()) j["description"] = description_;
    if (!op_.empty()) j["op"] = op_;
    if (parent_span_id_) j["parent_span_id"] = *parent_span_id_;
    if (sampled_) j["sampled"] = *sampled_;
    j["span_id"] = span_id_;
    j["start_timestamp"] = start_timestamp_;
    if (status_) j["status"] = span_status_name(*status_);
    if (!tags_.empty()) j["tags"] = tags_;
    if (end_timestamp_) j["timestamp"] = *end_timestamp_;
    j["trace_id"] = trace_id_;
    return j;
}

} // namespace tracesdk
