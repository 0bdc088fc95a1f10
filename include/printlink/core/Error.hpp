#pragma once

#include <system_error>

namespace printlink::core {

/**
 * @brief Failure reasons reported by connectors, sessions and probers.
 *
 * Values start at 1 so a default-constructed std::error_code never compares
 * equal to a printlink error.
 */
enum class Errc {
    ConnectTimeout = 1,
    ConnectRefused,
    NetworkUnreachable,
    AlreadyConnected,
    NotConnected,
    WriteFailure,
    SocketClosedByPeer,
    ProbeFailure,
    InvalidAddress
};

const std::error_category& printlink_category() noexcept;

std::error_code make_error_code(Errc code) noexcept;

/**
 * @brief Map a platform error from a connect attempt onto the printlink taxonomy.
 *
 * Timeouts, refusals and unreachable networks become the matching Errc value.
 * Anything else (including errors already in the printlink category) is
 * returned unchanged.
 */
std::error_code classifyConnectError(const std::error_code& ec);

} // namespace printlink::core

namespace std {
template <>
struct is_error_code_enum<printlink::core::Errc> : true_type {};
} // namespace std
