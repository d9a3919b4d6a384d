#include "tracing/transaction.hpp"
#include "client/client.hpp"
#include "core/utils.hpp"
#include "hub/hub.hpp"
#include "tracing/tracestate.hpp"

#include <algorithm>

namespace tracesdk {

Transaction::Transaction(PrivateTag, TransactionContext context, Hub* hub)
    : name_(std::move(context.name)),
      trim_end_(context.trim_end),
      hub_(hub) {
    std::optional<std::string> inherited = std::move(context.tracestate);
    span_ = std::make_shared<Span>(static_cast<SpanContext&&>(std::move(context)));

    tracestate_ = (inherited && !inherited->empty()) ? std::move(*inherited) : new_tracestate();
}

std::shared_ptr<Transaction> Transaction::create(TransactionContext context, Hub* hub) {
    auto tx = std::make_shared<Transaction>(PrivateTag{}, std::move(context), hub);
    tx->span_->transaction_ = tx;
    return tx;
}

std::string Transaction::new_tracestate() const {
    const Client* client = hub_ ? hub_->get_client().get() : nullptr;
    if (!client || !client->dsn()) {
        return {};
    }

    const auto& options = client->options();
    TracestateData data;
    data.trace_id = span_->trace_id();
    data.public_key = client->dsn()->public_key;
    if (!options.environment.empty()) data.environment = options.environment;
    if (!options.release.empty()) data.release = options.release;

    auto encoded = encode_tracestate(data);
    if (encoded.is_error()) {
        utils::log::warn(encoded.error_message());
        return "";
    }
    return std::move(encoded.value());
}

void Transaction::init_span_recorder(size_t maxlen) {
    if (recorder_) return;

    recorder_ = std::make_shared<SpanRecorder>(maxlen);
    span_->recorder_ = recorder_;
    (void)recorder_->add(span_);
}

std::shared_ptr<Span> Transaction::start_child(SpanContext context) {
    return span_->start_child(std::move(context));
}

std::vector<std::shared_ptr<Span>> Transaction::finished_spans() const {
    std::vector<std::shared_ptr<Span>> finished;
    if (!recorder_) return finished;

    for (const auto& s : recorder_->spans()) {
        if (s != span_ && s->is_finished()) {
            finished.push_back(s);
        }
    }
    return finished;
}

std::optional<std::string> Transaction::finish(std::optional<double> end_timestamp) {
    // Already finished: never dispatch twice
    if (span_->is_finished()) {
        return std::nullopt;
    }

    if (name_.empty()) {
        utils::log::warn(std::string("Transaction has no name, falling back to `") +
            kUnlabeledTransaction + "`.");
        name_ = kUnlabeledTransaction;
    }

    (void)span_->close(end_timestamp);

    if (span_->sampled() != true) {
        utils::log::debug("[Tracing] Discarding transaction because its trace was not chosen to be sampled.");
        return std::nullopt;
    }

    const auto finished = finished_spans();

    if (trim_end_ && !finished.empty()) {
        const auto latest = std::max_element(finished.begin(), finished.end(),
            [](const std::shared_ptr<Span>& a, const std::shared_ptr<Span>& b) {
                return *a->end_timestamp() < *b->end_timestamp();
            });
        span_->end_timestamp_ = (*latest)->end_timestamp();
    }

    nlohmann::json event = build_event(finished);

    if (!hub_) {
        utils::log::warn("[Tracing] Transaction " + name_ + " has no hub, event not sent.");
        return std::nullopt;
    }
    return hub_->capture_event(std::move(event));
}

nlohmann::json Transaction::build_event(const std::vector<std::shared_ptr<Span>>& spans) const {
    nlohmann::json event;
    event["contexts"]["trace"] = span_->get_trace_context();

    nlohmann::json span_list = nlohmann::json::array();
    for (const auto& s : spans) {
        span_list.push_back(s->to_json());
    }
    event["spans"] = std::move(span_list);

    event["start_timestamp"] = span_->start_timestamp();
    event["tags"] = span_->tags();
    event["timestamp"] = *span_->end_timestamp();
    event["tracestate"] = tracestate_;
    event["transaction"] = name_;
    event["type"] = "transaction";

    if (!measurements_.empty()) {
        nlohmann::json m = nlohmann::json::object();
        for (const auto& [key, measurement] : measurements_) {
            m[key]["value"] = measurement.value;
            if (!measurement.unit.empty()) m[key]["unit"] = measurement.unit;
        }
        utils::log::debug("[Measurements] Adding measurements to transaction " +
            m.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
        event["measurements"] = std::move(m);
    }

    return event;
}

} // namespace tracesdk
