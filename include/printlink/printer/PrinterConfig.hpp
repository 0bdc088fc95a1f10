#pragma once

#include "printlink/probe/LivenessProber.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace printlink::printer {

namespace config {

/**
 * @brief Defaults for raw TCP printers. Option structs below start from these.
 */

// Networking ------------------------------------------------------------------
constexpr std::uint16_t PRINTER_PORT_DEFAULT = 9100;   // raw / JetDirect printing
constexpr std::chrono::milliseconds CONNECT_TIMEOUT_DEFAULT{5000};
constexpr std::chrono::milliseconds SEND_TIMEOUT_DEFAULT{30000};  // whole payload, see ConnectorOptions

// Discovery -------------------------------------------------------------------
constexpr std::chrono::milliseconds DISCOVERY_TIMEOUT_DEFAULT{4000};
constexpr int DISCOVERY_MAX_IN_FLIGHT = 254;

// Liveness probing ------------------------------------------------------------
constexpr std::chrono::milliseconds PROBE_INTERVAL_DEFAULT{3000};
constexpr std::chrono::milliseconds PROBE_TIMEOUT_DEFAULT{7000};

} // namespace config

struct ConnectorOptions {
    std::chrono::milliseconds connectTimeout = config::CONNECT_TIMEOUT_DEFAULT;
    /// Limit for one send() call to hand the whole payload to the socket. It is
    /// not a stall detector: a large raster job draining into a slow printer
    /// needs a limit sized for the job. Expiry tears the connection down.
    std::chrono::milliseconds sendTimeout = config::SEND_TIMEOUT_DEFAULT;
    probe::ProbeSettings probe{config::PROBE_INTERVAL_DEFAULT, config::PROBE_TIMEOUT_DEFAULT};
    /// When false no liveness prober is started; only socket events end a connection.
    bool probingEnabled = true;
};

struct DiscoveryOptions {
    /// Address whose /24 is scanned. Empty means "ask the local-address service".
    std::optional<std::string> address;
    std::uint16_t port = config::PRINTER_PORT_DEFAULT;
    std::chrono::milliseconds timeout = config::DISCOVERY_TIMEOUT_DEFAULT;
    int maxInFlight = config::DISCOVERY_MAX_IN_FLIGHT;
};

} // namespace printlink::printer
