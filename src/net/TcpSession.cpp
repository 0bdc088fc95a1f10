#include "printlink/net/TcpSession.hpp"

#include "printlink/log/Log.hpp"
#include "printlink/net/Deadline.hpp"

namespace printlink::net {

using core::Errc;

std::shared_ptr<TcpSession> TcpSession::create(std::shared_ptr<asio::io_context> io) {
    return std::shared_ptr<TcpSession>(new TcpSession(std::move(io)));
}

TcpSession::TcpSession(std::shared_ptr<asio::io_context> io)
: io_(std::move(io))
, strand_(asio::make_strand(*io_))
, socket_(strand_)
{}

TcpSession::~TcpSession() {
    // Only reachable once no handler holds a reference, so touching the socket is safe here.
    std::error_code ignored;
    socket_.close(ignored);
}

bool TcpSession::calledFromIoThread() const {
    return io_->get_executor().running_in_this_thread();
}

expected<void> TcpSession::open(const core::Endpoint& endpoint, duration timeout) {
    if (calledFromIoThread()) {
        logError("[TcpSession] open() called from the I/O thread\n");
        return unexpected(std::make_error_code(std::errc::resource_deadlock_would_occur));
    }
    if (attempted_.exchange(true)) {
        return unexpected(Errc::AlreadyConnected);
    }

    auto self = shared_from_this();
    const auto target = endpoint.toTcp();
    const auto effectiveTimeout = timeout.count() < 0 ? duration::zero() : timeout;

    std::error_code ec = with_deadline(strand_, effectiveTimeout,
        [self, target](auto completion){ self->socket_.async_connect(target, completion); },
        [self]{ self->closeSocket(); });

    if (closed_.load()) {
        // close() raced with the connect; the owner has already given up on us.
        logInfo("[TcpSession] connect to ", endpoint.toString(), " cancelled by close()\n");
        return unexpected(std::make_error_code(std::errc::operation_canceled));
    }

    if (ec) {
        auto classified = core::classifyConnectError(ec);
        logError("[TcpSession] connect to ", endpoint.toString(), " failed: ",
                 ec.message(), " (", classified.message(), ")",
                 " timeout=", effectiveTimeout.count(), "ms\n");
        close();
        return unexpected(classified);
    }

    connected_.store(true);
    setLowLatency();
    logInfo("[TcpSession] connected to ", endpoint.toString(), "\n");
    return {};
}

void TcpSession::setLowLatency() {
    asio::post(strand_, [self = shared_from_this()] {
        std::error_code ec;
        self->socket_.set_option(tcp::no_delay(true), ec);
        self->socket_.set_option(asio::socket_base::keep_alive(true), ec);
    });
}

void TcpSession::startReading(EventHandler handler) {
    asio::post(strand_, [self = shared_from_this(), handler = std::move(handler)]() mutable {
        if (self->closed_.load()) {
            return;
        }
        self->handler_ = std::move(handler);
        self->readNext();
    });
}

void TcpSession::readNext() {
    socket_.async_read_some(asio::buffer(readBuffer_),
        [self = shared_from_this()](const std::error_code& ec, std::size_t n) {
            if (self->closed_.load()) {
                return;
            }

            if (!ec) {
                Bytes data(self->readBuffer_.begin(), self->readBuffer_.begin() + n);
                logDebug("[TcpSession] received ", n, " bytes\n");
                if (self->handler_) self->handler_(SessionEvent::Data, data, ec);
                self->readNext();
                return;
            }

            // Keep the handler alive for this call even though closing drops it.
            auto handler = std::move(self->handler_);
            self->closed_.store(true);
            self->closeSocket();

            if (ec == asio::error::eof) {
                logInfo("[TcpSession] peer closed the connection\n");
                if (handler) handler(SessionEvent::Closed, {}, core::make_error_code(Errc::SocketClosedByPeer));
            } else {
                logError("[TcpSession] socket error: ", ec.message(), "\n");
                if (handler) handler(SessionEvent::Errored, {}, ec);
            }
        });
}

expected<void> TcpSession::send(const Bytes& bytes, duration timeout) {
    if (!isOpen()) {
        return unexpected(Errc::NotConnected);
    }
    if (calledFromIoThread()) {
        logError("[TcpSession] send() called from the I/O thread\n");
        return unexpected(std::make_error_code(std::errc::resource_deadlock_would_occur));
    }

    // One composed write at a time; concurrent callers queue here.
    std::lock_guard lock(writeMutex_);

    auto self = shared_from_this();
    // The write may outlive this call if the deadline wins, so it owns its bytes.
    auto payload = std::make_shared<Bytes>(bytes);
    const auto effectiveTimeout = timeout.count() < 0 ? duration::zero() : timeout;

    std::error_code ec = with_deadline(strand_, effectiveTimeout,
        [self, payload](auto completion){
            asio::async_write(self->socket_, asio::buffer(*payload),
                [payload, completion](const std::error_code& op_ec, std::size_t) mutable {
                    completion(op_ec);
                });
        },
        [self]{ self->closeSocket(); });

    if (ec) {
        logError("[TcpSession] write of ", bytes.size(), " bytes failed: ", ec.message(), "\n");
        close();
        return unexpected(Errc::WriteFailure);
    }

    logDebug("[TcpSession] sent ", bytes.size(), " bytes\n");
    return {};
}

void TcpSession::close() {
    if (closed_.exchange(true)) {
        return;
    }
    logDebug("[TcpSession] close()\n");
    asio::post(strand_, [self = shared_from_this()] {
        self->handler_ = nullptr;
        self->closeSocket();
    });
}

void TcpSession::closeSocket() {
    if (!socket_.is_open()) return;
    std::error_code ec;
    // cancel -> shutdown -> close
    socket_.cancel(ec);
    socket_.shutdown(tcp::socket::shutdown_both, ec);
    socket_.close(ec);
}

bool TcpSession::isOpen() const {
    return connected_.load() && !closed_.load();
}

} // namespace printlink::net
