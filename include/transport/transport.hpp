#pragma once

#include <string>

namespace tracesdk {

/**
 * @brief Serialized outbound payload, ready for a transport
 */
struct Request {
    std::string body;
    std::string type;   // "transaction", "session", "event", ...
    std::string url;
};

/**
 * @brief Abstract interface for outbound payload destinations
 *
 * Delivery, retries and queueing belong to the implementation; the client
 * hands over each request once and does not wait for the outcome.
 */
class ITransport {
public:
    virtual ~ITransport() = default;

    /// Accept a single request for delivery. Returns true if it was accepted.
    [[nodiscard]] virtual bool send(const Request& request) = 0;

    /// Flush any buffered data to the underlying destination.
    virtual void flush() = 0;

    /// Human-readable transport name for logging (e.g. "file:/tmp/envelopes.log")
    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace tracesdk
