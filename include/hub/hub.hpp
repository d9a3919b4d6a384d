#pragma once

#include "hub/scope.hpp"
#include "tracing/sampler.hpp"
#include "tracing/sampling_context.hpp"
#include "tracing/span_context.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace tracesdk {

class Client;
class Transaction;

/**
 * @brief Entry point for starting transactions and exit point for events
 *
 * There is no process-wide current hub: whoever manages request isolation
 * owns a Hub per logical context and passes it explicitly. Transactions keep
 * a non-owning pointer back to their hub, so a hub must outlive the
 * transactions it starts.
 */
class Hub {
public:
    explicit Hub(std::shared_ptr<Client> client = nullptr);

    Hub(const Hub&) = delete;
    Hub& operator=(const Hub&) = delete;

    [[nodiscard]] std::shared_ptr<Client> get_client() const { return client_; }
    void bind_client(std::shared_ptr<Client> client) { client_ = std::move(client); }

    [[nodiscard]] Scope& get_scope() { return scope_; }
    [[nodiscard]] const Scope& get_scope() const { return scope_; }

    void configure_scope(const std::function<void(Scope&)>& callback);

    /**
     * @brief Start a transaction with a resolved sampling decision
     *
     * Builds the sampling context (transaction context, parent decision,
     * runtime environment data and `custom_sampling_context`), resolves
     * `sampled`, and attaches a span recorder bounded by the client's
     * max_spans. The transaction is not put on the scope.
     */
    [[nodiscard]] std::shared_ptr<Transaction> start_transaction(
        TransactionContext context,
        nlohmann::json custom_sampling_context = nlohmann::json::object());

    /// Apply the scope and pass the event to the client
    std::optional<std::string> capture_event(nlohmann::json event);

    /// Supplier of request/location data for sampling contexts
    void set_sampling_environment_provider(SamplingEnvironmentProvider provider) {
        environment_provider_ = std::move(provider);
    }

    /// Substitute the sampler's random source (deterministic tests)
    void set_random_source(RandomSource random) { sampler_.set_random_source(std::move(random)); }

    [[nodiscard]] Sampler& sampler() { return sampler_; }

private:
    [[nodiscard]] SamplingContext build_sampling_context(const TransactionContext& context,
                                                         nlohmann::json custom) const;

    std::shared_ptr<Client> client_;
    Scope scope_;
    Sampler sampler_;
    SamplingEnvironmentProvider environment_provider_;
};

} // namespace tracesdk
