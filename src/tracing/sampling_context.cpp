#include "tracing/sampling_context.hpp"

namespace tracesdk {

nlohmann::json RequestData::to_json() const {
    nlohmann::json j;
    j["headers"] = headers;
    j["method"] = method;
    j["url"] = url;
    j["cookies"] = cookies;
    j["query_string"] = query_string;
    return j;
}

} // namespace tracesdk
