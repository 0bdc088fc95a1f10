#pragma once
#include "printlink/core/Endpoint.hpp"
#include "printlink/core/Expected.hpp"
#include "printlink/core/StatusStream.hpp"
#include "printlink/net/NetConfig.hpp"
#include "printlink/net/NetService.hpp"
#include "printlink/printer/PrinterConfig.hpp"
#include "printlink/probe/LivenessProber.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace printlink::printer {

using printlink::expected;

/**
 * @brief Manages the single connection to one raw-TCP printer.
 *
 * Owns at most one TcpSession and its paired LivenessProber. Both are created
 * by a successful connect() and destroyed together by whichever comes first:
 * disconnect(), a failed send(), the printer closing or breaking the socket,
 * or a failed liveness probe. That teardown runs exactly once per connection
 * and ends by publishing ConnectionStatus::None.
 *
 * Construct one connector per printer link and keep it for as long as the link
 * is managed; there is no global instance. Public calls block the calling
 * thread and must not be made from status or receive callbacks, which run on
 * the I/O thread.
 */
class TcpPrinterConnector {
public:
    using Bytes = std::vector<std::uint8_t>;
    using ReceiveHandler = std::function<void(const Bytes&)>;

    /**
     * @param proberFactory Creates the liveness prober for each connection.
     *                      Empty selects ICMP probing on @p io.
     */
    explicit TcpPrinterConnector(
        ConnectorOptions options = {},
        std::shared_ptr<net::asio::io_context> io = net::shared_io_context(),
        probe::ProberFactory proberFactory = {});
    ~TcpPrinterConnector();

    // non-copyable / non-movable
    TcpPrinterConnector(const TcpPrinterConnector&) = delete;
    TcpPrinterConnector& operator=(const TcpPrinterConnector&) = delete;
    TcpPrinterConnector(TcpPrinterConnector&&) = delete;
    TcpPrinterConnector& operator=(TcpPrinterConnector&&) = delete;

    /**
     * @brief Open the connection and start liveness probing.
     *
     * Fails with Errc::AlreadyConnected, without side effects, unless the
     * status is None. Connection failures (Errc::ConnectTimeout,
     * Errc::ConnectRefused, Errc::NetworkUnreachable) leave the status at None.
     *
     * @param timeout Connect deadline; defaults to ConnectorOptions::connectTimeout.
     */
    expected<void> connect(const core::Endpoint& endpoint,
                           std::optional<net::duration> timeout = std::nullopt);

    /// Convenience overload that parses dotted quad strings (Errc::InvalidAddress otherwise).
    expected<void> connect(const std::string& address,
                           std::uint16_t port = config::PRINTER_PORT_DEFAULT,
                           std::optional<net::duration> timeout = std::nullopt);

    /// Write @p bytes to the printer. Errc::NotConnected unless Connected.
    expected<void> send(const Bytes& bytes);

    /**
     * @brief Close the connection, wait @p delay if given, then publish None.
     *
     * Succeeds trivially when there is nothing to close.
     */
    expected<void> disconnect(std::optional<net::duration> delay = std::nullopt);

    /// Status transitions, in order. Subscribe before connect() to see them all.
    core::StatusStream& statusStream();

    core::ConnectionStatus status() const;
    bool isConnected() const;

    /// Printer currently connected (or being connected to).
    std::optional<core::Endpoint> endpoint() const;

    /// Bytes received from the printer are passed here, on the I/O thread.
    void setReceiveHandler(ReceiveHandler handler);

    const ConnectorOptions& options() const;

private:
    /// Everything that can happen to a live connection, funnelled into one dispatcher.
    enum class LinkEvent {
        DataReceived,
        SocketClosed,
        SocketErrored,
        ProbeReply,
        ProbeFailed,
        SendFailed,
        DisconnectRequested
    };

    struct State;
    std::shared_ptr<State> state_;
};

} // namespace printlink::printer
