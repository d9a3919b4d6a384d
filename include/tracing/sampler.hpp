#pragma once

#include "tracing/sampling_context.hpp"
#include "tracing/span_context.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>

namespace tracesdk {

class Client;

/// Uniform pseudo-random values in [0, 1)
using RandomSource = std::function<double()>;

/**
 * @brief Resolves the sampling decision for a new transaction
 *
 * Precedence, first match wins:
 *   1. an explicit `sampled` in the transaction context
 *   2. no client, or neither traces_sampler nor traces_sample_rate set -> false
 *   3. traces_sampler, called with the sampling context
 *   4. the parent's decision (only when there is no traces_sampler)
 *   5. traces_sample_rate
 * A rate from 3 or 5 is validated first; an invalid rate logs a warning and
 * resolves to false. Never throws.
 */
class Sampler {
public:
    /// Seeds a std::mt19937_64 from std::random_device
    Sampler();
    explicit Sampler(RandomSource random);

    [[nodiscard]] bool resolve(const TransactionContext& context,
                               const Client* client,
                               const SamplingContext& sampling_context) const;

    /// Substitute the random source (deterministic tests)
    void set_random_source(RandomSource random);

    /**
     * @brief Validate a raw rate and normalize it to a probability
     *
     * Booleans map to 1/0; numbers must be in [0, 1] and not NaN. Anything
     * else logs a warning and yields std::nullopt.
     */
    [[nodiscard]] static std::optional<double> normalize_sample_rate(const nlohmann::json& rate);

private:
    RandomSource random_;
};

} // namespace tracesdk
