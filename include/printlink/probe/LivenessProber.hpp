#pragma once
#include "printlink/net/NetConfig.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <system_error>

namespace printlink::probe {

struct ProbeSettings {
    /// Time between echo requests.
    net::duration interval{std::chrono::seconds(3)};
    /// How long a single request may go unanswered before it counts as failed.
    net::duration timeout{std::chrono::seconds(7)};
};

struct ProbeOutcome {
    enum class Kind {
        Reply,
        Error
    };

    Kind kind = Kind::Reply;
    std::uint16_t sequence = 0;
    net::duration roundTrip{0};
    std::error_code error;      ///< Errc::ProbeFailure when kind == Error

    bool ok() const { return kind == Kind::Reply; }
};

/**
 * @brief Periodic reachability check of one address, independent of any data socket.
 *
 * start() begins probing and reports every outcome to the handler (on the I/O
 * thread). stop() cancels the pending timer and any outstanding request; once
 * it returns, outcomes that have not started dispatching are dropped by the
 * prober. Both calls are idempotent and never block.
 */
class LivenessProber {
public:
    using OutcomeHandler = std::function<void(const ProbeOutcome&)>;

    virtual ~LivenessProber() = default;

    virtual void start(const net::asio::ip::address_v4& address,
                       const ProbeSettings& settings,
                       OutcomeHandler handler) = 0;
    virtual void stop() = 0;
    virtual bool running() const = 0;
};

using ProberFactory = std::function<std::unique_ptr<LivenessProber>()>;

} // namespace printlink::probe
