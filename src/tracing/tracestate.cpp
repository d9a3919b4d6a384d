#include "tracing/tracestate.hpp"
#include "core/base64.hpp"
#include "core/utf16.hpp"

#include <nlohmann/json.hpp>

namespace tracesdk {

namespace {

constexpr char kPaddingSentinel = '.';

// Keep the error text short when echoing an untrusted header value
std::string preview(std::string_view value) {
    constexpr size_t kMaxPreview = 256;
    if (value.size() <= kMaxPreview) return std::string(value);
    return std::string(value.substr(0, kMaxPreview)) + "...";
}

} // anonymous namespace

Result<std::string> encode_tracestate(const TracestateData& data) {
    std::string text;
    try {
        // Insertion order matches the payload other SDKs produce
        nlohmann::ordered_json j;
        j["trace_id"] = data.trace_id;
        j["public_key"] = data.public_key;
        j["environment"] = data.environment;
        j["release"] = data.release;
        text = j.dump();
    } catch (const nlohmann::json::exception& e) {
        return Result<std::string>::error(ErrorCategory::ENCODING_ERROR,
            std::string("Unable to serialize tracestate: ") + e.what());
    }

    const auto bytes = utf16::from_utf8(text);
    if (!bytes) {
        return Result<std::string>::error(ErrorCategory::ENCODING_ERROR,
            "Unable to convert string to base64: " + preview(text));
    }

    std::string encoded = base64::encode(*bytes);
    const auto last = encoded.find_last_not_of('=');
    if (last != std::string::npos && last + 1 < encoded.size()) {
        encoded.erase(last + 1);
        encoded += kPaddingSentinel;
    }
    return Result<std::string>::ok(std::move(encoded));
}

Result<std::string> decode_tracestate(std::string_view value) {
    std::string b64(value);
    if (!b64.empty() && b64.back() == kPaddingSentinel) {
        b64.back() = '=';
    }
    while (b64.size() % 4 == 2 || b64.size() % 4 == 3) {
        b64 += '=';
    }

    const auto bytes = base64::decode_strict(b64);
    if (!bytes) {
        return Result<std::string>::error(ErrorCategory::ENCODING_ERROR,
            "Unable to convert from base64. Input isn't valid base64: " + preview(value));
    }

    auto text = utf16::to_utf8(*bytes);
    if (!text) {
        return Result<std::string>::error(ErrorCategory::ENCODING_ERROR,
            "Unable to convert string from base64: " + preview(value));
    }
    return Result<std::string>::ok(std::move(*text));
}

Result<TracestateData> parse_tracestate(std::string_view value) {
    auto decoded = decode_tracestate(value);
    if (decoded.is_error()) {
        return Result<TracestateData>::error(decoded.error_category(), decoded.error_message());
    }

    try {
        const auto j = nlohmann::json::parse(decoded.value());
        if (!j.is_object()) {
            return Result<TracestateData>::error(ErrorCategory::ENCODING_ERROR,
                "tracestate payload is not a JSON object");
        }
        TracestateData data;
        data.trace_id = j.value("trace_id", std::string{});
        data.public_key = j.value("public_key", std::string{});
        data.environment = j.value("environment", std::string(kNoEnvironment));
        data.release = j.value("release", std::string(kNoRelease));
        return Result<TracestateData>::ok(std::move(data));
    } catch (const nlohmann::json::exception& e) {
        return Result<TracestateData>::error(ErrorCategory::ENCODING_ERROR,
            std::string("tracestate payload is not valid JSON: ") + e.what());
    }
}

} // namespace tracesdk
