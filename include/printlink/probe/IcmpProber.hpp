#pragma once
#include "printlink/net/NetService.hpp"
#include "printlink/probe/LivenessProber.hpp"

#include <memory>

namespace printlink::probe {

namespace detail {
struct IcmpEngine;
}

/**
 * @brief LivenessProber that sends ICMP echo requests.
 *
 * Prefers an unprivileged ICMP datagram socket (Linux, subject to
 * net.ipv4.ping_group_range) and falls back to a raw ICMP socket, which needs
 * CAP_NET_RAW. If neither can be opened the prober logs once and stays silent,
 * leaving disconnect detection to the TCP session.
 *
 * Every `interval` one echo request goes out with the next sequence number. A
 * matching reply produces a Reply outcome; a request still unanswered after
 * `timeout`, or a send that the network rejects, produces an Error outcome.
 */
class IcmpProber : public LivenessProber {
public:
    explicit IcmpProber(std::shared_ptr<net::asio::io_context> io = net::shared_io_context());
    ~IcmpProber() override;

    IcmpProber(const IcmpProber&) = delete;
    IcmpProber& operator=(const IcmpProber&) = delete;

    void start(const net::asio::ip::address_v4& address,
               const ProbeSettings& settings,
               OutcomeHandler handler) override;
    void stop() override;
    bool running() const override;

    /// Whether this host allows either kind of ICMP socket for the current user.
    static bool available();

private:
    std::shared_ptr<net::asio::io_context> io_;
    std::shared_ptr<detail::IcmpEngine> engine_;
};

ProberFactory icmpProberFactory(std::shared_ptr<net::asio::io_context> io = net::shared_io_context());

} // namespace printlink::probe
