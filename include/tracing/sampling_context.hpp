#pragma once

#include "tracing/span_context.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>

namespace tracesdk {

/**
 * @brief Normalized incoming request, supplied by server-side instrumentation
 */
struct RequestData {
    std::map<std::string, std::string> headers;
    std::string method;
    std::string url;
    std::map<std::string, std::string> cookies;
    std::string query_string;

    [[nodiscard]] nlohmann::json to_json() const;
};

using LocationData = std::map<std::string, std::string>;

/**
 * @brief Runtime data the instrumentation layer attaches to every sampling decision
 */
struct SamplingEnvironment {
    std::optional<RequestData> request;
    std::optional<LocationData> location;
};

using SamplingEnvironmentProvider = std::function<SamplingEnvironment()>;

/**
 * @brief Everything a traces sampler callback gets to look at
 *
 * Built per Hub::start_transaction() call.
 */
struct SamplingContext {
    TransactionContext transaction_context;
    std::optional<bool> parent_sampled;
    std::optional<RequestData> request;
    std::optional<LocationData> location;
    nlohmann::json custom = nlohmann::json::object();
};

/**
 * @brief User decision function
 *
 * Returns a raw rate: a number in [0, 1] or a boolean. Anything else is
 * rejected by the sampler with a warning and treated as "not sampled".
 */
using TracesSampler = std::function<nlohmann::json(const SamplingContext&)>;

} // namespace tracesdk
