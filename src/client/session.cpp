#include "client/session.hpp"
#include "core/utils.hpp"

namespace tracesdk {

const char* session_status_name(SessionStatus status) {
    switch (status) {
        case SessionStatus::OK:       return "ok";
        case SessionStatus::EXITED:   return "exited";
        case SessionStatus::CRASHED:  return "crashed";
        case SessionStatus::ABNORMAL: return "abnormal";
    }
    return "ok";
}

Session Session::start(std::string release, std::string environment) {
    Session s;
    s.sid = utils::generate_uuid();
    s.started = utils::now();
    s.timestamp = s.started;
    s.release = std::move(release);
    s.environment = std::move(environment);
    return s;
}

void Session::close(SessionStatus final_status) {
    if (status != SessionStatus::OK) return;

    status = final_status;
    timestamp = utils::now();
    duration = std::chrono::duration<double>(timestamp - started).count();
}

nlohmann::json Session::to_json() const {
    nlohmann::json j;
    j["sid"] = sid;
    if (did) j["did"] = *did;
    j["init"] = init;
    j["started"] = utils::format_iso8601(started);
    j["timestamp"] = utils::format_iso8601(timestamp);
    j["status"] = session_status_name(status);
    j["errors"] = errors;
    if (duration) j["duration"] = *duration;

    nlohmann::json attrs = nlohmann::json::object();
    if (!release.empty()) attrs["release"] = release;
    if (!environment.empty()) attrs["environment"] = environment;
    if (!user_agent.empty()) attrs["user_agent"] = user_agent;
    if (!ip_address.empty()) attrs["ip_address"] = ip_address;
    j["attrs"] = std::move(attrs);
    return j;
}

} // namespace tracesdk
