#pragma once

#include "tracing/sampling_context.hpp"
#include "tracing/span_recorder.hpp"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>

namespace tracesdk {

struct ClientOptions {
    std::string dsn;                       // empty = events are not sent
    std::string environment;
    std::string release;

    // Fixed rate: null = not configured, otherwise a number or boolean.
    // Validated when a sampling decision is made, not on assignment.
    nlohmann::json traces_sample_rate;

    TracesSampler traces_sampler;          // takes precedence over the fixed rate

    size_t max_spans = kDefaultMaxSpans;   // span recorder bound per transaction
    bool debug = false;                    // lowers the log level to debug
};

} // namespace tracesdk
