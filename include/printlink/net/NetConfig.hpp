#pragma once

#include <asio.hpp>       // standalone Asio, header-only
#include <chrono>
#include <system_error>   // std::error_code

namespace printlink::net {

/**
 * @brief Centralises networking aliases so higher-level code never includes Asio directly.
 *
 * Exposes:
 * - `printlink::net::asio` as the standalone Asio namespace.
 * - `printlink::net::tcp` and `printlink::net::icmp` protocol aliases.
 * - `printlink::net::duration`, the millisecond type used for every timeout.
 */
namespace asio = ::asio;

using tcp = asio::ip::tcp;
using icmp = asio::ip::icmp;
using error_code = std::error_code;
using duration = std::chrono::milliseconds;

} // namespace printlink::net
