#pragma once
#include "printlink/core/Endpoint.hpp"
#include "printlink/net/NetConfig.hpp"
#include "printlink/net/NetService.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace printlink::net {

namespace detail {
struct ScanJob;
}

/**
 * @brief Lazy, finite sequence of endpoints that accepted a TCP connection.
 *
 * Endpoints arrive in completion order. next() blocks the calling thread until
 * the next endpoint is available or every attempt has settled, in which case it
 * returns std::nullopt (and keeps doing so). Destroying the stream cancels
 * attempts that are still pending.
 */
class ScanStream {
public:
    ScanStream() = default;
    ~ScanStream();

    ScanStream(ScanStream&&) noexcept = default;
    ScanStream& operator=(ScanStream&& other) noexcept;
    ScanStream(const ScanStream&) = delete;
    ScanStream& operator=(const ScanStream&) = delete;

    std::optional<core::Endpoint> next();

    /// Drain the remaining endpoints.
    std::vector<core::Endpoint> collect();

    /// Abort pending attempts and end the stream. Idempotent.
    void cancel();

    /// Attempts that have completed, successfully or not.
    int settledCount() const;

private:
    friend class SubnetScanner;
    explicit ScanStream(std::shared_ptr<detail::ScanJob> job) : job_(std::move(job)) {}

    std::shared_ptr<detail::ScanJob> job_;
};

/**
 * @brief Probes every host of a /24 for a listening TCP port.
 *
 * Each of the 254 host addresses gets one connect attempt bounded by the
 * timeout; at most `maxInFlight` attempts run at once (all of them by
 * default). Refused, unreachable and timed-out hosts are silently skipped.
 * Nothing is cached: every scan() call is a fresh scan.
 */
class SubnetScanner {
public:
    explicit SubnetScanner(std::shared_ptr<asio::io_context> io = shared_io_context())
    : io_(std::move(io)) {}

    /**
     * @param prefix Three-octet prefix such as "192.168.1". An invalid prefix
     *               yields an empty stream without touching the network.
     */
    ScanStream scan(std::string_view prefix,
                    std::uint16_t port,
                    duration timeout,
                    int maxInFlight = core::kHostsPerSubnet);

    ScanStream scan(const asio::ip::address_v4& network,
                    std::uint16_t port,
                    duration timeout,
                    int maxInFlight = core::kHostsPerSubnet);

private:
    std::shared_ptr<asio::io_context> io_;
};

} // namespace printlink::net
