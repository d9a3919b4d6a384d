#include "client/client.hpp"
#include "core/utils.hpp"
#include "transport/envelope.hpp"

namespace tracesdk {

Client::Client(ClientOptions options, std::shared_ptr<ITransport> transport)
    : options_(std::move(options)),
      transport_(std::move(transport)) {
    if (options_.debug) {
        utils::log::set_level(utils::log::Level::DEBUG);
    }

    if (!options_.dsn.empty()) {
        auto parsed = Dsn::parse(options_.dsn);
        if (parsed.is_ok()) {
            dsn_ = std::move(parsed.value());
        } else {
            utils::log::error(parsed.error_message());
        }
    }
}

void Client::prepare_event(nlohmann::json& event) const {
    if (!event.contains("event_id") || !event["event_id"].is_string()) {
        event["event_id"] = utils::generate_uuid();
    }
    if (!event.contains("timestamp")) {
        event["timestamp"] = utils::timestamp_in_seconds();
    }
    if (!event.contains("platform")) {
        event["platform"] = "native";
    }
    if (!event.contains("environment") && !options_.environment.empty()) {
        event["environment"] = options_.environment;
    }
    if (!event.contains("release") && !options_.release.empty()) {
        event["release"] = options_.release;
    }
}

std::optional<std::string> Client::capture_event(nlohmann::json event) {
    if (!event.is_object()) {
        utils::log::warn("Discarded event: event payload must be a JSON object");
        return std::nullopt;
    }
    if (!dsn_) {
        utils::log::debug("Discarded event: no valid Dsn configured");
        return std::nullopt;
    }
    if (!transport_) {
        utils::log::debug("Discarded event: no transport configured");
        return std::nullopt;
    }

    prepare_event(event);
    std::string event_id = event["event_id"].get<std::string>();

    const Request request = event_to_request(std::move(event), *dsn_);
    if (!transport_->send(request)) {
        utils::log::warn("Transport " + transport_->name() + " rejected " +
            request.type + " " + event_id);
        return std::nullopt;
    }

    utils::log::debug("Sent " + request.type + " " + event_id);
    return event_id;
}

bool Client::capture_session(const Session& session) {
    if (!dsn_ || !transport_) {
        utils::log::debug("Discarded session update: no valid Dsn or transport configured");
        return false;
    }

    const Request request = session_to_request(session, *dsn_);
    if (!transport_->send(request)) {
        utils::log::warn("Transport " + transport_->name() + " rejected session " + session.sid);
        return false;
    }
    return true;
}

void Client::flush() {
    if (transport_) {
        transport_->flush();
    }
}

} // namespace tracesdk
