#include "tracing/sampler.hpp"
#include "client/client.hpp"
#include "core/utils.hpp"

#include <cmath>
#include <exception>
#include <memory>
#include <random>

namespace tracesdk {

namespace {

RandomSource default_random_source() {
    auto gen = std::make_shared<std::mt19937_64>(std::random_device{}());
    return [gen]() {
        std::uniform_real_distribution<double> dist(0.0, 1.0);
        return dist(*gen);
    };
}

std::string describe(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) +
        " of type " + value.type_name();
}

} // anonymous namespace

Sampler::Sampler()
    : random_(default_random_source()) {}

Sampler::Sampler(RandomSource random)
    : random_(random ? std::move(random) : default_random_source()) {}

void Sampler::set_random_source(RandomSource random) {
    random_ = random ? std::move(random) : default_random_source();
}

std::optional<double> Sampler::normalize_sample_rate(const nlohmann::json& rate) {
    if (rate.is_boolean()) {
        return rate.get<bool>() ? 1.0 : 0.0;
    }

    if (!rate.is_number() || std::isnan(rate.get<double>())) {
        utils::log::warn("[Tracing] Given sample rate is invalid. Sample rate must be a boolean "
            "or a number between 0 and 1. Got " + describe(rate) + ".");
        return std::nullopt;
    }

    const double value = rate.get<double>();
    if (value < 0.0 || value > 1.0) {
        utils::log::warn("[Tracing] Given sample rate is invalid. Sample rate must be between "
            "0 and 1. Got " + describe(rate) + ".");
        return std::nullopt;
    }

    return value;
}

bool Sampler::resolve(const TransactionContext& context,
                      const Client* client,
                      const SamplingContext& sampling_context) const {
    if (context.sampled.has_value()) {
        return *context.sampled;
    }

    if (!client) {
        return false;
    }

    const auto& options = client->options();
    if (!options.traces_sampler && options.traces_sample_rate.is_null()) {
        return false;
    }

    std::optional<double> rate;
    if (options.traces_sampler) {
        nlohmann::json raw;
        try {
            raw = options.traces_sampler(sampling_context);
        } catch (const std::exception& e) {
            utils::log::warn(std::string("[Tracing] tracesSampler threw: ") + e.what());
            return false;
        }
        rate = normalize_sample_rate(raw);
    } else if (context.parent_sampled.has_value()) {
        utils::log::debug(std::string("[Tracing] Inheriting parent's sampling decision: ") +
            utils::booltostr(*context.parent_sampled));
        return *context.parent_sampled;
    } else {
        rate = normalize_sample_rate(options.traces_sample_rate);
    }

    if (!rate) {
        utils::log::debug("[Tracing] Discarding transaction because of invalid sample rate.");
        return false;
    }

    if (*rate == 0.0) {
        utils::log::debug(options.traces_sampler
            ? "[Tracing] Discarding transaction because tracesSampler returned 0 or false"
            : "[Tracing] Discarding transaction because tracesSampleRate is set to 0");
        return false;
    }

    const bool sampled = random_() < *rate;
    if (!sampled) {
        utils::log::debug("[Tracing] Discarding transaction because it's not included in the "
            "random sample (sampling rate = " + std::to_string(*rate) + ")");
    }
    return sampled;
}

} // namespace tracesdk
