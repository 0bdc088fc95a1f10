/**
 * @brief Connection state machine for raw-TCP printers: connect, send, teardown.
 */
#include "printlink/printer/TcpPrinterConnector.hpp"

#include "printlink/log/Log.hpp"
#include "printlink/net/TcpSession.hpp"
#include "printlink/probe/IcmpProber.hpp"

#include <mutex>
#include <thread>

namespace printlink::printer {

using core::ConnectionStatus;
using core::Errc;
using printlink::unexpected;

/**
 * Connector state shared with session and prober callbacks. Callbacks hold a
 * weak_ptr, so they become no-ops once the connector is gone.
 *
 * `generation` identifies the current connection. Every callback carries the
 * generation it was registered for; teardown bumps the counter under the
 * mutex, which retires all callbacks of that connection at once. This is what
 * makes teardown run exactly once when several causes race.
 */
struct TcpPrinterConnector::State : std::enable_shared_from_this<TcpPrinterConnector::State> {
    State(ConnectorOptions opts,
          std::shared_ptr<net::asio::io_context> ioContext,
          probe::ProberFactory factory)
    : options(std::move(opts))
    , io(std::move(ioContext))
    , proberFactory(std::move(factory))
    , stream(io)
    {}

    const ConnectorOptions options;
    std::shared_ptr<net::asio::io_context> io;
    probe::ProberFactory proberFactory;
    core::StatusStream stream;

    mutable std::mutex mutex;
    ConnectionStatus status = ConnectionStatus::None;
    std::uint64_t generation = 0;
    std::shared_ptr<net::TcpSession> session;
    std::unique_ptr<probe::LivenessProber> prober;
    std::optional<core::Endpoint> endpoint;
    bool disconnecting = false;
    ReceiveHandler receiveHandler;

    static const char* describe(LinkEvent event) {
        switch (event) {
            case LinkEvent::DataReceived:        return "data received";
            case LinkEvent::SocketClosed:        return "socket closed by printer";
            case LinkEvent::SocketErrored:       return "socket error";
            case LinkEvent::ProbeReply:          return "probe reply";
            case LinkEvent::ProbeFailed:         return "liveness probe failed";
            case LinkEvent::SendFailed:          return "send failed";
            case LinkEvent::DisconnectRequested: return "disconnect requested";
        }
        return "unknown";
    }

    // Requires `mutex`. Idempotent.
    void releaseHandlesLocked() {
        if (prober) {
            prober->stop();
            prober.reset();
        }
        if (session) {
            session->close();
            session.reset();
        }
    }

    // Requires `mutex`.
    void publishNoneLocked() {
        status = ConnectionStatus::None;
        endpoint.reset();
        stream.publish(ConnectionStatus::None);
    }

    void startMonitoringLocked(std::uint64_t gen) {
        std::weak_ptr<State> weak = weak_from_this();

        session->startReading(
            [weak, gen](net::SessionEvent event, const net::TcpSession::Bytes& data, const std::error_code& ec) {
                auto self = weak.lock();
                if (!self) return;
                switch (event) {
                    case net::SessionEvent::Data:
                        self->handleLinkEvent(LinkEvent::DataReceived, gen, ec, data);
                        break;
                    case net::SessionEvent::Closed:
                        self->handleLinkEvent(LinkEvent::SocketClosed, gen, ec);
                        break;
                    case net::SessionEvent::Errored:
                        self->handleLinkEvent(LinkEvent::SocketErrored, gen, ec);
                        break;
                }
            });

        if (!options.probingEnabled || !proberFactory) {
            return;
        }
        prober = proberFactory();
        if (!prober) {
            return;
        }
        prober->start(endpoint->address(), options.probe,
            [weak, gen](const probe::ProbeOutcome& outcome) {
                auto self = weak.lock();
                if (!self) return;
                if (outcome.ok()) {
                    self->handleLinkEvent(LinkEvent::ProbeReply, gen, {});
                } else {
                    self->handleLinkEvent(LinkEvent::ProbeFailed, gen, outcome.error);
                }
            });
    }

    /// The single entry point for everything that happens to a live connection.
    void handleLinkEvent(LinkEvent event,
                         std::uint64_t gen,
                         const std::error_code& ec,
                         const Bytes& data = {}) {
        if (event == LinkEvent::DataReceived) {
            ReceiveHandler handler;
            {
                std::lock_guard lock(mutex);
                if (gen != generation) return;
                handler = receiveHandler;
            }
            logDebug("[TcpPrinterConnector] received ", data.size(), " bytes\n");
            if (handler) handler(data);
            return;
        }

        if (event == LinkEvent::ProbeReply) {
            return;
        }

        std::lock_guard lock(mutex);
        if (gen != generation || status != ConnectionStatus::Connected || disconnecting) {
            logDebug("[TcpPrinterConnector] ignoring ", describe(event), " for a retired connection\n");
            return;
        }

        logWarning("[TcpPrinterConnector] ", describe(event),
                   ec ? ": " : "", ec ? ec.message() : std::string(),
                   " -> disconnected from ", endpoint ? endpoint->toString() : std::string("?"), "\n");

        ++generation;
        releaseHandlesLocked();
        publishNoneLocked();
    }
};

TcpPrinterConnector::TcpPrinterConnector(ConnectorOptions options,
                                         std::shared_ptr<net::asio::io_context> io,
                                         probe::ProberFactory proberFactory) {
    if (!proberFactory) {
        proberFactory = probe::icmpProberFactory(io);
    }
    state_ = std::make_shared<State>(std::move(options), std::move(io), std::move(proberFactory));
}

TcpPrinterConnector::~TcpPrinterConnector() {
    // Orderly shutdown: retire callbacks, stop probing and close the socket.
    std::lock_guard lock(state_->mutex);
    ++state_->generation;
    state_->releaseHandlesLocked();
    state_->status = ConnectionStatus::None;
    state_->endpoint.reset();
}

expected<void>
TcpPrinterConnector::connect(const std::string& address,
                             std::uint16_t port,
                             std::optional<net::duration> timeout) {
    auto endpoint = core::Endpoint::parse(address, port);
    if (!endpoint) {
        logError("[TcpPrinterConnector] invalid IP '", address, "'\n");
        return unexpected(endpoint.error());
    }
    return connect(*endpoint, timeout);
}

expected<void>
TcpPrinterConnector::connect(const core::Endpoint& endpoint,
                             std::optional<net::duration> timeout) {
    const auto connectTimeout = timeout.value_or(state_->options.connectTimeout);

    std::shared_ptr<net::TcpSession> session;
    std::uint64_t gen = 0;
    {
        std::lock_guard lock(state_->mutex);
        if (state_->status != ConnectionStatus::None) {
            logWarning("[TcpPrinterConnector] connect(", endpoint.toString(), ") rejected: status is ",
                       core::toString(state_->status), "\n");
            return unexpected(Errc::AlreadyConnected);
        }
        state_->status = ConnectionStatus::Connecting;
        state_->endpoint = endpoint;
        gen = ++state_->generation;
        session = net::TcpSession::create(state_->io);
        state_->session = session;
    }

    auto opened = session->open(endpoint, connectTimeout);

    std::lock_guard lock(state_->mutex);
    if (gen != state_->generation) {
        // disconnect() gave up on this attempt while it was in flight.
        session->close();
        logInfo("[TcpPrinterConnector] connect to ", endpoint.toString(), " abandoned\n");
        return unexpected(std::make_error_code(std::errc::operation_canceled));
    }

    if (!opened) {
        state_->session.reset();
        state_->endpoint.reset();
        state_->status = ConnectionStatus::None;
        logError("[TcpPrinterConnector] connect to ", endpoint.toString(),
                 " failed: ", opened.error().message(), "\n");
        return unexpected(opened.error());
    }

    state_->status = ConnectionStatus::Connected;
    state_->stream.publish(ConnectionStatus::Connected);
    state_->startMonitoringLocked(gen);

    logInfo("[TcpPrinterConnector] connected to ", endpoint.toString(), "\n");
    return {};
}

expected<void>
TcpPrinterConnector::send(const Bytes& bytes) {
    std::shared_ptr<net::TcpSession> session;
    std::uint64_t gen = 0;
    {
        std::lock_guard lock(state_->mutex);
        if (state_->status != ConnectionStatus::Connected || !state_->session) {
            return unexpected(Errc::NotConnected);
        }
        session = state_->session;
        gen = state_->generation;
    }

    auto sent = session->send(bytes, state_->options.sendTimeout);
    if (!sent && sent.error() == Errc::WriteFailure) {
        state_->handleLinkEvent(LinkEvent::SendFailed, gen, sent.error());
    }
    return sent;
}

expected<void>
TcpPrinterConnector::disconnect(std::optional<net::duration> delay) {
    {
        std::lock_guard lock(state_->mutex);
        switch (state_->status) {
            case ConnectionStatus::None:
                // Nothing is live, but drop anything left behind.
                state_->releaseHandlesLocked();
                return {};

            case ConnectionStatus::Connecting:
                logInfo("[TcpPrinterConnector] disconnect() while connecting; abandoning attempt\n");
                ++state_->generation;
                state_->releaseHandlesLocked();
                state_->status = ConnectionStatus::None;
                state_->endpoint.reset();
                return {};

            case ConnectionStatus::Connected:
                break;
        }

        if (state_->disconnecting) {
            return {};
        }

        logInfo("[TcpPrinterConnector] ", State::describe(LinkEvent::DisconnectRequested),
                " for ", state_->endpoint->toString(), "\n");
        ++state_->generation;
        state_->releaseHandlesLocked();

        if (!delay || delay->count() <= 0) {
            state_->publishNoneLocked();
            return {};
        }
        state_->disconnecting = true;
    }

    if (state_->io->get_executor().running_in_this_thread()) {
        logError("[TcpPrinterConnector] disconnect delay ignored on the I/O thread\n");
    } else {
        std::this_thread::sleep_for(*delay);
    }

    std::lock_guard lock(state_->mutex);
    state_->disconnecting = false;
    state_->publishNoneLocked();
    return {};
}

core::StatusStream& TcpPrinterConnector::statusStream() {
    return state_->stream;
}

core::ConnectionStatus TcpPrinterConnector::status() const {
    std::lock_guard lock(state_->mutex);
    return state_->status;
}

bool TcpPrinterConnector::isConnected() const {
    return status() == ConnectionStatus::Connected;
}

std::optional<core::Endpoint> TcpPrinterConnector::endpoint() const {
    std::lock_guard lock(state_->mutex);
    return state_->endpoint;
}

void TcpPrinterConnector::setReceiveHandler(ReceiveHandler handler) {
    std::lock_guard lock(state_->mutex);
    state_->receiveHandler = std::move(handler);
}

const ConnectorOptions& TcpPrinterConnector::options() const {
    return state_->options;
}

} // namespace printlink::printer
