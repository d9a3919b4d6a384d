#pragma once

#include "tracing/span_context.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace tracesdk {

class Transaction;
class SpanRecorder;

/**
 * @brief A timed unit of work in a trace
 *
 * Spans are created through Transaction::start_child() or Span::start_child()
 * and shared between the caller and the transaction's SpanRecorder. The
 * links back to the owning transaction and to the recorder are weak, so the
 * recorder is the only owner and no ownership cycle forms.
 *
 * Not safe for concurrent mutation.
 */
class Span : public std::enable_shared_from_this<Span> {
public:
    /// Free-standing span; generates missing ids and defaults the start to now.
    explicit Span(SpanContext context = {});

    Span(const Span&) = delete;
    Span& operator=(const Span&) = delete;

    /**
     * @brief Start a child span
     *
     * The child shares trace_id, sampled, transaction and recorder with this
     * span, and its parent_span_id is this span's id. Valid before and after
     * this span (or the transaction) finishes.
     */
    std::shared_ptr<Span> start_child(SpanContext context = {});

    /**
     * @brief Set the end timestamp (default now); a no-op once finished
     *
     * Finishing the root span of a transaction finishes the transaction.
     */
    void finish(std::optional<double> end_timestamp = std::nullopt);

    [[nodiscard]] bool is_finished() const { return end_timestamp_.has_value(); }

    void set_tag(const std::string& key, const std::string& value);
    void set_data(const std::string& key, nlohmann::json value);
    void set_status(SpanStatus status) { status_ = status; }

    /// Records the "http.status_code" tag and the matching status
    void set_http_status(int http_status);

    /// True when no status was set or the status is OK
    [[nodiscard]] bool is_success() const;

    void set_op(std::string op) { op_ = std::move(op); }
    void set_description(std::string description) { description_ = std::move(description); }

    [[nodiscard]] const std::string& trace_id() const { return trace_id_; }
    [[nodiscard]] const std::string& span_id() const { return span_id_; }
    [[nodiscard]] const std::optional<std::string>& parent_span_id() const { return parent_span_id_; }
    [[nodiscard]] std::optional<bool> sampled() const { return sampled_; }
    [[nodiscard]] const std::string& op() const { return op_; }
    [[nodiscard]] const std::string& description() const { return description_; }
    [[nodiscard]] const TagMap& tags() const { return tags_; }
    [[nodiscard]] const nlohmann::json& data() const { return data_; }
    [[nodiscard]] std::optional<SpanStatus> status() const { return status_; }
    [[nodiscard]] double start_timestamp() const { return start_timestamp_; }
    [[nodiscard]] std::optional<double> end_timestamp() const { return end_timestamp_; }

    /// Owning transaction, or nullptr for a free-standing span
    [[nodiscard]] std::shared_ptr<Transaction> transaction() const { return transaction_.lock(); }

    /// Recorder this span was added to, or nullptr if none (or dropped)
    [[nodiscard]] std::shared_ptr<SpanRecorder> recorder() const { return recorder_.lock(); }

    /// Trace-parent header value for outgoing requests made within this span
    [[nodiscard]] std::string to_traceparent() const;

    /// The "trace" entry of an event's contexts
    [[nodiscard]] nlohmann::json get_trace_context() const;

    /// Serialized form used in a transaction's "spans" list
    [[nodiscard]] nlohmann::json to_json() const;

private:
    friend class Transaction;
    friend class SpanRecorder;

    /// Sets the end timestamp; false if it was already set.
    bool close(std::optional<double> end_timestamp);

    std::string trace_id_;
    std::string span_id_;
    std::optional<std::string> parent_span_id_;
    std::optional<bool> sampled_;
    std::string op_;
    std::string description_;
    TagMap tags_;
    nlohmann::json data_;
    std::optional<SpanStatus> status_;
    double start_timestamp_ = 0.0;
    std::optional<double> end_timestamp_;

    std::weak_ptr<Transaction> transaction_;
    std::weak_ptr<SpanRecorder> recorder_;
};

} // namespace tracesdk
