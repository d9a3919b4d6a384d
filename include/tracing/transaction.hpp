#pragma once

#include "tracing/span.hpp"
#include "tracing/span_context.hpp"
#include "tracing/span_recorder.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tracesdk {

class Hub;

inline constexpr const char* kUnlabeledTransaction = "<unlabeled transaction>";

struct Measurement {
    double value = 0.0;
    std::string unit;
};

using Measurements = std::map<std::string, Measurement>;

/**
 * @brief Root span of a trace
 *
 * Composition rather than inheritance: a Transaction embeds its root Span
 * record and adds the name, the tracestate computed once at construction,
 * measurements and the span recorder. The Hub pointer is non-owning and
 * only used to dispatch the finished event; the hub must outlive the
 * transaction.
 *
 * Create through Hub::start_transaction() or Transaction::create().
 */
class Transaction : public std::enable_shared_from_this<Transaction> {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /**
     * @brief Build a transaction; `hub` may be null (nothing is dispatched)
     *
     * The tracestate is taken from the context when inherited, otherwise
     * computed from the hub's client and DSN. Without a client or DSN the
     * tracestate stays empty and propagation of it is skipped.
     */
    [[nodiscard]] static std::shared_ptr<Transaction> create(TransactionContext context, Hub* hub);

    /// Only reachable through create(); public for std::make_shared
    Transaction(PrivateTag, TransactionContext context, Hub* hub);

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    [[nodiscard]] const std::string& name() const { return name_; }
    void set_name(std::string name) { name_ = std::move(name); }

    [[nodiscard]] const std::string& tracestate() const { return tracestate_; }

    /// Replace the measurement map with a copy of `measurements`
    void set_measurements(const Measurements& measurements) { measurements_ = measurements; }
    [[nodiscard]] const Measurements& measurements() const { return measurements_; }

    [[nodiscard]] bool trim_end() const { return trim_end_; }

    /// Attach a span recorder and record the root span; later calls are no-ops.
    void init_span_recorder(size_t maxlen = kDefaultMaxSpans);

    [[nodiscard]] std::shared_ptr<SpanRecorder> span_recorder() const { return recorder_; }

    /// Start a direct child of the root span
    std::shared_ptr<Span> start_child(SpanContext context = {});

    /**
     * @brief Finish the transaction and dispatch it if sampled
     *
     * Returns the event id from the hub, or std::nullopt when already
     * finished, not sampled or not dispatched.
     */
    std::optional<std::string> finish(std::optional<double> end_timestamp = std::nullopt);

    /// Recorded children (root excluded) that have an end timestamp
    [[nodiscard]] std::vector<std::shared_ptr<Span>> finished_spans() const;

    /// The embedded root span record
    [[nodiscard]] const std::shared_ptr<Span>& span() const { return span_; }

    [[nodiscard]] const std::string& trace_id() const { return span_->trace_id(); }
    [[nodiscard]] const std::string& span_id() const { return span_->span_id(); }
    [[nodiscard]] const std::optional<std::string>& parent_span_id() const { return span_->parent_span_id(); }
    [[nodiscard]] std::optional<bool> sampled() const { return span_->sampled(); }
    [[nodiscard]] bool is_finished() const { return span_->is_finished(); }
    [[nodiscard]] double start_timestamp() const { return span_->start_timestamp(); }
    [[nodiscard]] std::optional<double> end_timestamp() const { return span_->end_timestamp(); }

    void set_tag(const std::string& key, const std::string& value) { span_->set_tag(key, value); }
    void set_status(SpanStatus status) { span_->set_status(status); }
    void set_http_status(int http_status) { span_->set_http_status(http_status); }

    [[nodiscard]] std::string to_traceparent() const { return span_->to_traceparent(); }

private:
    [[nodiscard]] std::string new_tracestate() const;
    [[nodiscard]] nlohmann::json build_event(const std::vector<std::shared_ptr<Span>>& spans) const;

    std::shared_ptr<Span> span_;
    std::string name_;
    std::string tracestate_;
    Measurements measurements_;
    bool trim_end_ = false;
    Hub* hub_ = nullptr;
    std::shared_ptr<SpanRecorder> recorder_;
};

} // namespace tracesdk
