#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace tracesdk {

enum class SessionStatus {
    OK,
    EXITED,
    CRASHED,
    ABNORMAL
};

[[nodiscard]] const char* session_status_name(SessionStatus status);

/**
 * @brief Release-health session, serialized into a two-part session envelope
 */
struct Session {
    std::string sid;
    std::optional<std::string> did;
    SessionStatus status = SessionStatus::OK;
    std::chrono::system_clock::time_point started;
    std::chrono::system_clock::time_point timestamp;
    uint32_t errors = 0;
    std::optional<double> duration;
    bool init = true;

    // attrs
    std::string release;
    std::string environment;
    std::string user_agent;
    std::string ip_address;

    /// New session with a fresh sid, started now
    [[nodiscard]] static Session start(std::string release, std::string environment);

    /// Set the terminal status and record the duration; a no-op unless status is OK
    void close(SessionStatus final_status = SessionStatus::EXITED);

    [[nodiscard]] nlohmann::json to_json() const;
};

} // namespace tracesdk
