#pragma once

#include "core/error.hpp"

#include <string>
#include <string_view>

namespace tracesdk {

/**
 * @brief Parsed destination identifier
 *
 * Format: "{protocol}://{public_key}[:{pass}]@{host}[:{port}]/[{path}/]{project_id}"
 */
struct Dsn {
    std::string protocol;
    std::string public_key;
    std::string pass;
    std::string host;
    std::string port;
    std::string path;
    std::string project_id;

    /// CONFIG_ERROR when the string does not follow the format above.
    [[nodiscard]] static Result<Dsn> parse(std::string_view dsn);

    /// Render back to string form; the password is only included on request.
    [[nodiscard]] std::string to_string(bool with_password = false) const;

    /// "{protocol}://{host}[:{port}]/[{path}/]api/{project_id}/"
    [[nodiscard]] std::string api_base_url() const;

    /// Endpoint for flat (non-envelope) event payloads, with url-encoded auth
    [[nodiscard]] std::string store_endpoint_with_auth() const;

    /// Endpoint for envelope payloads (transactions, sessions), with url-encoded auth
    [[nodiscard]] std::string envelope_endpoint_with_auth() const;

private:
    [[nodiscard]] std::string auth_query() const;
};

} // namespace tracesdk
