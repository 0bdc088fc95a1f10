#pragma once
#include "printlink/core/Endpoint.hpp"
#include "printlink/core/Expected.hpp"
#include "printlink/net/NetConfig.hpp"
#include "printlink/net/NetService.hpp"

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace printlink::net {

enum class SessionEvent {
    Data,       ///< bytes arrived from the printer
    Closed,     ///< orderly close by the peer
    Errored     ///< socket error; the session has closed itself
};

/**
 * @brief Owns exactly one TCP socket to one printer.
 *
 * Highlights:
 * - `open(...)` connects under a deadline and enables TCP_NODELAY + keepalive.
 * - `send(...)` blocks the caller until every byte is written or the deadline passes.
 * - `startReading(...)` runs a read loop on the I/O thread and reports inbound
 *   bytes, peer close and socket errors. The session reports; it never decides
 *   what the owner does about them.
 * - `close()` is idempotent. Once it returns no further events are delivered.
 *
 * All socket work is serialized by a strand. Sessions are single use: create a
 * new one for every connection. Always held by shared_ptr so in-flight handlers
 * keep it alive.
 */
class TcpSession : public std::enable_shared_from_this<TcpSession> {
public:
    using Bytes = std::vector<std::uint8_t>;
    using EventHandler = std::function<void(SessionEvent, const Bytes&, const std::error_code&)>;

    static std::shared_ptr<TcpSession> create(
        std::shared_ptr<asio::io_context> io = shared_io_context());

    ~TcpSession();

    TcpSession(const TcpSession&) = delete;
    TcpSession& operator=(const TcpSession&) = delete;

    /**
     * @brief Connect to @p endpoint, waiting at most @p timeout.
     *
     * Fails with Errc::ConnectTimeout, Errc::ConnectRefused or
     * Errc::NetworkUnreachable (other platform errors pass through), or with
     * std::errc::operation_canceled when close() interrupts the attempt. On
     * failure the socket is closed and nothing is retained.
     */
    expected<void> open(const core::Endpoint& endpoint, duration timeout);

    /// Begin delivering socket events to @p handler. Call once, after open().
    void startReading(EventHandler handler);

    /**
     * @brief Write all of @p bytes within @p timeout.
     *
     * Fails with Errc::NotConnected when the session is not open, or
     * Errc::WriteFailure when the write errors or times out; in the latter case
     * the session closes itself first.
     */
    expected<void> send(const Bytes& bytes, duration timeout);

    void close();
    bool isOpen() const;

private:
    explicit TcpSession(std::shared_ptr<asio::io_context> io);

    bool calledFromIoThread() const;
    void setLowLatency();
    void readNext();
    void closeSocket();   // strand only

    std::shared_ptr<asio::io_context> io_;
    asio::strand<asio::io_context::executor_type> strand_;
    tcp::socket socket_;
    std::array<std::uint8_t, 4096> readBuffer_{};
    EventHandler handler_;
    std::mutex writeMutex_;
    std::atomic<bool> attempted_{false};
    std::atomic<bool> connected_{false};
    std::atomic<bool> closed_{false};
};

} // namespace printlink::net
