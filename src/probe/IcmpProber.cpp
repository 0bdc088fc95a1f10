#include "printlink/probe/IcmpProber.hpp"

#include "printlink/core/Error.hpp"
#include "printlink/log/Log.hpp"
#include "printlink/net/IcmpPacket.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <map>
#include <random>

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace printlink::probe {

namespace asio = printlink::net::asio;
using net::icmp;
using SteadyClock = std::chrono::steady_clock;

namespace {

constexpr net::duration kMinimumInterval{10};
const std::array<std::uint8_t, 16> kEchoPayload{
    'p', 'r', 'i', 'n', 't', 'l', 'i', 'n', 'k', '-', 'p', 'r', 'o', 'b', 'e', 0};

/// Datagram ICMP first (no privileges needed on Linux), raw ICMP second.
int openIcmpDescriptor(bool& datagram) {
    int fd = ::socket(AF_INET, SOCK_DGRAM, IPPROTO_ICMP);
    if (fd >= 0) {
        datagram = true;
        return fd;
    }
    fd = ::socket(AF_INET, SOCK_RAW, IPPROTO_ICMP);
    if (fd >= 0) {
        datagram = false;
        return fd;
    }
    return -1;
}

std::uint16_t makeIdentifier() {
    std::random_device rd;
    return static_cast<std::uint16_t>((static_cast<unsigned>(::getpid()) ^ rd()) & 0xFFFFu);
}

} // namespace

namespace detail {

struct IcmpEngine : std::enable_shared_from_this<IcmpEngine> {
    struct Pending {
        SteadyClock::time_point sentAt;
        std::shared_ptr<asio::steady_timer> expiry;
    };

    IcmpEngine(std::shared_ptr<asio::io_context> ioContext,
               const asio::ip::address_v4& target,
               const ProbeSettings& probeSettings,
               LivenessProber::OutcomeHandler outcomeHandler)
    : io(std::move(ioContext))
    , strand(asio::make_strand(*io))
    , socket(strand)
    , interval(strand)
    , address(target)
    , settings(probeSettings)
    , handler(std::move(outcomeHandler))
    , identifier(makeIdentifier())
    {
        if (settings.interval < kMinimumInterval) settings.interval = kMinimumInterval;
        if (settings.timeout < net::duration{1}) settings.timeout = net::duration{1};
    }

    std::shared_ptr<asio::io_context> io;
    asio::strand<asio::io_context::executor_type> strand;
    icmp::socket socket;
    asio::steady_timer interval;
    asio::ip::address_v4 address;
    ProbeSettings settings;
    LivenessProber::OutcomeHandler handler;
    std::atomic<bool> stopped{false};

    // strand only
    bool datagram = true;
    std::uint16_t identifier;
    std::uint16_t nextSequence = 1;
    std::map<std::uint16_t, Pending> pending;
    std::array<std::uint8_t, 1500> rx{};
    icmp::endpoint from;

    void begin() {
        asio::post(strand, [self = shared_from_this()] {
            if (self->stopped.load() || !self->openSocket()) {
                return;
            }
            logDebug("[IcmpProber] probing ", self->address.to_string(),
                     " every ", self->settings.interval.count(), "ms (",
                     self->datagram ? "datagram" : "raw", " socket)\n");
            self->receiveNext();
            self->tick();
        });
    }

    bool openSocket() {
        bool isDatagram = true;
        const int fd = openIcmpDescriptor(isDatagram);
        if (fd < 0) {
            logWarning("[IcmpProber] no ICMP socket available; liveness probing disabled for ",
                       address.to_string(), "\n");
            return false;
        }
        std::error_code ec;
        socket.assign(icmp::v4(), fd, ec);
        if (ec) {
            ::close(fd);
            logWarning("[IcmpProber] could not adopt ICMP socket: ", ec.message(), "\n");
            return false;
        }
        datagram = isDatagram;
        return true;
    }

    void tick() {
        if (stopped.load()) return;
        sendEcho();
        interval.expires_after(settings.interval);
        interval.async_wait([self = shared_from_this()](const std::error_code& ec) {
            if (ec) return;
            self->tick();
        });
    }

    void sendEcho() {
        net::IcmpEcho echo;
        echo.type = net::IcmpType::EchoRequest;
        echo.identifier = identifier;
        echo.sequence = nextSequence++;
        echo.payload.assign(kEchoPayload.begin(), kEchoPayload.end());

        const auto sequence = echo.sequence;
        auto bytes = std::make_shared<std::vector<std::uint8_t>>(echo.encode());

        auto expiry = std::make_shared<asio::steady_timer>(strand);
        pending[sequence] = Pending{SteadyClock::now(), expiry};
        expiry->expires_after(settings.timeout);
        expiry->async_wait([self = shared_from_this(), sequence](const std::error_code& ec) {
            if (ec) return;
            self->fail(sequence, asio::error::timed_out);
        });

        socket.async_send_to(asio::buffer(*bytes), icmp::endpoint(address, 0),
            [self = shared_from_this(), bytes, sequence](const std::error_code& ec, std::size_t) {
                if (!ec || ec == asio::error::operation_aborted) return;
                self->fail(sequence, ec);
            });
    }

    void receiveNext() {
        socket.async_receive_from(asio::buffer(rx), from,
            [self = shared_from_this()](const std::error_code& ec, std::size_t n) {
                if (self->stopped.load() || ec == asio::error::operation_aborted ||
                    ec == asio::error::bad_descriptor) {
                    return;
                }
                if (ec) {
                    // Datagram ICMP sockets surface unreachable reports as receive errors.
                    logDebug("[IcmpProber] receive error: ", ec.message(), "\n");
                    self->failOldest(ec);
                } else {
                    self->handleDatagram(n);
                }
                self->receiveNext();
            });
    }

    void handleDatagram(std::size_t n) {
        std::size_t offset = 0;
        if (!datagram) {
            offset = net::ipv4HeaderLength(rx.data(), n);
            if (offset == 0) return;
        }

        net::IcmpEcho reply;
        if (!reply.decode(rx.data() + offset, n - offset)) return;
        if (reply.type != net::IcmpType::EchoReply) return;
        if (from.address() != asio::ip::address(address)) return;
        // The kernel rewrites the identifier of datagram sockets.
        if (!datagram && reply.identifier != identifier) return;

        auto it = pending.find(reply.sequence);
        if (it == pending.end()) return;     // late or duplicate reply

        ProbeOutcome outcome;
        outcome.kind = ProbeOutcome::Kind::Reply;
        outcome.sequence = reply.sequence;
        outcome.roundTrip = std::chrono::duration_cast<net::duration>(SteadyClock::now() - it->second.sentAt);
        it->second.expiry->cancel();
        pending.erase(it);
        emit(outcome);
    }

    void fail(std::uint16_t sequence, const std::error_code& ec) {
        auto it = pending.find(sequence);
        if (it == pending.end()) return;
        it->second.expiry->cancel();
        pending.erase(it);

        ProbeOutcome outcome;
        outcome.kind = ProbeOutcome::Kind::Error;
        outcome.sequence = sequence;
        outcome.error = core::make_error_code(core::Errc::ProbeFailure);
        logInfo("[IcmpProber] ", address.to_string(), " seq=", sequence, " failed: ", ec.message(), "\n");
        emit(outcome);
    }

    void failOldest(const std::error_code& ec) {
        if (pending.empty()) return;
        fail(pending.begin()->first, ec);
    }

    void emit(const ProbeOutcome& outcome) {
        if (stopped.load()) return;
        if (handler) handler(outcome);
    }

    void stop() {
        if (stopped.exchange(true)) return;
        asio::post(strand, [self = shared_from_this()] {
            self->interval.cancel();
            for (auto& entry : self->pending) {
                entry.second.expiry->cancel();
            }
            self->pending.clear();
            std::error_code ignored;
            self->socket.close(ignored);
            self->handler = nullptr;
        });
    }
};

} // namespace detail

IcmpProber::IcmpProber(std::shared_ptr<asio::io_context> io)
: io_(std::move(io))
{}

IcmpProber::~IcmpProber() {
    stop();
}

void IcmpProber::start(const asio::ip::address_v4& address,
                       const ProbeSettings& settings,
                       OutcomeHandler handler) {
    stop();
    engine_ = std::make_shared<detail::IcmpEngine>(io_, address, settings, std::move(handler));
    engine_->begin();
}

void IcmpProber::stop() {
    if (!engine_) return;
    engine_->stop();
    engine_.reset();
}

bool IcmpProber::running() const {
    return engine_ && !engine_->stopped.load();
}

bool IcmpProber::available() {
    bool datagram = true;
    const int fd = openIcmpDescriptor(datagram);
    if (fd < 0) return false;
    ::close(fd);
    return true;
}

ProberFactory icmpProberFactory(std::shared_ptr<asio::io_context> io) {
    return [io = std::move(io)] {
        return std::unique_ptr<LivenessProber>(new IcmpProber(io));
    };
}

} // namespace printlink::probe
