#pragma once

#include "client/client_options.hpp"
#include "client/dsn.hpp"
#include "client/session.hpp"
#include "transport/transport.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace tracesdk {

/**
 * @brief Holds the configuration and hands finished events to the transport
 *
 * The DSN is parsed once at construction; an invalid DSN is logged and the
 * client then drops every event.
 */
class Client {
public:
    explicit Client(ClientOptions options, std::shared_ptr<ITransport> transport = nullptr);

    [[nodiscard]] const ClientOptions& options() const { return options_; }

    /// Parsed DSN, or std::nullopt if none (or an invalid one) was configured
    [[nodiscard]] const std::optional<Dsn>& dsn() const { return dsn_; }

    [[nodiscard]] const std::shared_ptr<ITransport>& transport() const { return transport_; }

    /**
     * @brief Prepare, serialize and send an event
     *
     * Fills event_id, timestamp, platform, environment and release when the
     * event lacks them. Returns the event id, or std::nullopt when the event
     * could not be handed to a transport.
     */
    std::optional<std::string> capture_event(nlohmann::json event);

    /// Send a session update as a session envelope. Returns false if not sent.
    bool capture_session(const Session& session);

    /// Flush the transport, if any
    void flush();

private:
    void prepare_event(nlohmann::json& event) const;

    ClientOptions options_;
    std::optional<Dsn> dsn_;
    std::shared_ptr<ITransport> transport_;
};

} // namespace tracesdk
