#include "transport/envelope.hpp"
#include "core/utils.hpp"
#include "tracing/tracestate.hpp"

namespace tracesdk {

namespace {

// Invalid UTF-8 inside user-supplied strings must not abort serialization
std::string dump(const nlohmann::ordered_json& j) {
    return j.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

std::string dump(const nlohmann::json& j) {
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string join_envelope(const std::string& header, const std::string& item_header,
                          const std::string& body) {
    std::string out;
    out.reserve(header.size() + item_header.size() + body.size() + 2);
    out += header;
    out += '\n';
    out += item_header;
    out += '\n';
    out += body;
    return out;
}

} // anonymous namespace

Request event_to_request(nlohmann::json event, const Dsn& dsn,
                         std::chrono::system_clock::time_point sent_at) {
    const bool has_string_type =
        event.is_object() && event.contains("type") && event["type"].is_string();
    if (has_string_type && event["type"].get<std::string>() == "transaction") {
        return transaction_to_request(std::move(event), dsn, sent_at);
    }

    Request req;
    req.type = has_string_type
        ? event["type"].get<std::string>()
        : "event";
    req.body = dump(event);
    req.url = dsn.store_endpoint_with_auth();
    return req;
}

Request transaction_to_request(nlohmann::json event, const Dsn& dsn,
                               std::chrono::system_clock::time_point sent_at) {
    nlohmann::ordered_json header;
    if (event.contains("event_id") && event["event_id"].is_string()) {
        header["event_id"] = event["event_id"].get<std::string>();
    }
    header["sent_at"] = utils::format_iso8601(sent_at);

    const auto trace_it = event.find("contexts");
    if (trace_it != event.end() && trace_it->is_object()) {
        const auto trace = trace_it->find("trace");
        if (trace != trace_it->end() && trace->is_object()) {
            const auto trace_id = trace->find("trace_id");
            if (trace_id != trace->end() && trace_id->is_string() &&
                !trace_id->get<std::string>().empty()) {
                header["trace_id"] = trace_id->get<std::string>();
            }
        }
    }

    // Trace context for dynamic sampling; an undecodable value degrades to ""
    const auto tracestate = event.find("tracestate");
    if (tracestate != event.end()) {
        if (tracestate->is_string() && !tracestate->get<std::string>().empty()) {
            auto decoded = decode_tracestate(tracestate->get<std::string>());
            if (decoded.is_error()) {
                utils::log::warn(decoded.error_message());
            }
            header["trace"] = decoded.value_or("");
        }
        event.erase(tracestate);
    }

    nlohmann::ordered_json item_header;
    item_header["type"] = "transaction";

    Request req;
    req.body = join_envelope(dump(header), dump(item_header), dump(event));
    req.type = "transaction";
    req.url = dsn.envelope_endpoint_with_auth();
    return req;
}

Request session_to_request(const Session& session, const Dsn& dsn,
                           std::chrono::system_clock::time_point sent_at) {
    nlohmann::ordered_json header;
    header["sent_at"] = utils::format_iso8601(sent_at);

    nlohmann::ordered_json item_header;
    item_header["type"] = "session";

    Request req;
    req.body = join_envelope(dump(header), dump(item_header), dump(session.to_json()));
    req.type = "session";
    req.url = dsn.envelope_endpoint_with_auth();
    return req;
}

} // namespace tracesdk
