#pragma once

#include "printlink/net/NetConfig.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace printlink::core {

/**
 * @brief Connection state of a printer connector.
 *
 * `Connecting` is reported by TcpPrinterConnector::status() while an attempt
 * is in flight; only `Connected` and `None` are ever published.
 */
enum class ConnectionStatus : std::uint8_t {
    None = 0,
    Connecting,
    Connected
};

const char* toString(ConnectionStatus status);

/**
 * @brief Multi-subscriber stream of status transitions.
 *
 * publish() queues the value on a strand of the I/O context, so listeners run
 * on the I/O thread, one at a time, in the exact order publish() was called.
 * Every listener sees every value; nothing is coalesced.
 *
 * Listeners must not block. Subscribing or unsubscribing from inside a
 * listener is allowed and takes effect from the next value.
 */
class StatusStream {
public:
    using Listener = std::function<void(ConnectionStatus)>;
    using SubscriptionId = std::uint64_t;

    explicit StatusStream(std::shared_ptr<net::asio::io_context> io);

    StatusStream(const StatusStream&) = delete;
    StatusStream& operator=(const StatusStream&) = delete;

    SubscriptionId subscribe(Listener listener);
    void unsubscribe(SubscriptionId id);
    std::size_t subscriberCount() const;

    void publish(ConnectionStatus status);

private:
    struct Shared {
        mutable std::mutex mutex;
        std::map<SubscriptionId, std::shared_ptr<Listener>> listeners;
        SubscriptionId nextId = 1;
    };

    std::shared_ptr<net::asio::io_context> io_;
    net::asio::strand<net::asio::io_context::executor_type> strand_;
    // Shared with queued deliveries so they stay valid if the stream goes first.
    std::shared_ptr<Shared> shared_;
};

} // namespace printlink::core
