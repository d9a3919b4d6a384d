#pragma once

#include "client/dsn.hpp"
#include "client/session.hpp"
#include "transport/transport.hpp"

#include <nlohmann/json.hpp>

#include <chrono>

namespace tracesdk {

/**
 * @brief Convert a captured event into its outbound request
 *
 * Transactions become a three-line envelope
 *   {"event_id", "sent_at", "trace_id", "trace"}\n{"type":"transaction"}\n{event}
 * where "trace" holds the decoded tracestate JSON text (empty string when it
 * cannot be decoded) and the body no longer carries "tracestate". Every other
 * event type is sent as a flat JSON body to the store endpoint. No trailing
 * newline in either form.
 */
[[nodiscard]] Request event_to_request(nlohmann::json event, const Dsn& dsn,
                                       std::chrono::system_clock::time_point sent_at =
                                           std::chrono::system_clock::now());

/// Transaction envelope; the event's "tracestate" is promoted to the envelope header.
[[nodiscard]] Request transaction_to_request(nlohmann::json event, const Dsn& dsn,
                                             std::chrono::system_clock::time_point sent_at =
                                                 std::chrono::system_clock::now());

/// Two-line session envelope: {"sent_at"}\n{"type":"session"}\n{session}
[[nodiscard]] Request session_to_request(const Session& session, const Dsn& dsn,
                                         std::chrono::system_clock::time_point sent_at =
                                             std::chrono::system_clock::now());

} // namespace tracesdk
