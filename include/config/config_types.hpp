#pragma once

#include "client/client_options.hpp"

#include <string>

namespace tracesdk {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Transport Config
// ============================================================================

struct TransportConfig {
    std::string file = "envelopes.log";
    bool flush_each_request = true;
};

// ============================================================================
// SdkConfig - Complete parsed configuration
// ============================================================================

struct SdkConfig {
    ClientOptions client;
    LoggingConfig logging;
    TransportConfig transport;
};

} // namespace tracesdk
