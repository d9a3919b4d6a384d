#include "hub/hub.hpp"
#include "client/client.hpp"
#include "core/utils.hpp"
#include "tracing/transaction.hpp"

namespace tracesdk {

Hub::Hub(std::shared_ptr<Client> client)
    : client_(std::move(client)) {}

void Hub::configure_scope(const std::function<void(Scope&)>& callback) {
    if (callback) {
        callback(scope_);
    }
}

SamplingContext Hub::build_sampling_context(const TransactionContext& context,
                                            nlohmann::json custom) const {
    SamplingContext sampling_context;
    sampling_context.transaction_context = context;
    sampling_context.parent_sampled = context.parent_sampled;
    sampling_context.custom = custom.is_object() ? std::move(custom) : nlohmann::json::object();

    if (environment_provider_) {
        SamplingEnvironment env = environment_provider_();
        sampling_context.request = std::move(env.request);
        sampling_context.location = std::move(env.location);
    }
    return sampling_context;
}

std::shared_ptr<Transaction> Hub::start_transaction(TransactionContext context,
                                                    nlohmann::json custom_sampling_context) {
    const SamplingContext sampling_context =
        build_sampling_context(context, std::move(custom_sampling_context));

    context.sampled = sampler_.resolve(context, client_.get(), sampling_context);

    const size_t max_spans = client_ ? client_->options().max_spans : kDefaultMaxSpans;

    utils::log::debug("[Tracing] starting " +
        (context.op.empty() ? std::string("(no op)") : context.op) + " transaction - " +
        (context.name.empty() ? std::string(kUnlabeledTransaction) : context.name));

    auto transaction = Transaction::create(std::move(context), this);
    transaction->init_span_recorder(max_spans);
    return transaction;
}

std::optional<std::string> Hub::capture_event(nlohmann::json event) {
    if (!client_) {
        utils::log::debug("No client bound to hub, event dropped");
        return std::nullopt;
    }
    if (!event.is_object()) {
        utils::log::warn("Event payload must be a JSON object, event dropped");
        return std::nullopt;
    }
    scope_.apply_to_event(event);
    return client_->capture_event(std::move(event));
}

} // namespace tracesdk
