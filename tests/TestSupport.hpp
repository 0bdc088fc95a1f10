#pragma once
#include "printlink/core/Error.hpp"
#include "printlink/core/StatusStream.hpp"
#include "printlink/log/Log.hpp"
#include "printlink/net/NetConfig.hpp"
#include "printlink/probe/LivenessProber.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <type_traits>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace testsupport {

inline int g_failures = 0;

template<typename T>
auto printable(const T& value) {
    if constexpr (std::is_enum_v<T>) {
        return static_cast<long long>(value);
    } else if constexpr (std::is_same_v<T, std::error_code>) {
        return value.message();
    } else if constexpr (std::is_integral_v<T>) {
        return +value;
    } else {
        return value;
    }
}

inline int finish(const char* name) {
    if (g_failures == 0) {
        printlink::logInfo(name, " passed.\n");
        return 0;
    }
    printlink::logError(name, ": ", g_failures, " failure(s)\n");
    return 1;
}

} // namespace testsupport

#define ASSERT_TRUE(cond, msg) \
    do { if (!(cond)) { printlink::logError("ASSERT TRUE FAILED: ", (msg), \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++testsupport::g_failures; } } while(0)

#define ASSERT_EQ(a,b,msg) \
    do { auto _va=(a); auto _vb=(b); if (!((_va)==(_vb))) { printlink::logError("ASSERT EQ FAILED: ", (msg), \
        "  (", testsupport::printable(_va), " != ", testsupport::printable(_vb), ")" \
        "  @ ", __FILE__, ":", __LINE__, "\n"); ++testsupport::g_failures; } } while(0)

namespace testsupport {

using namespace std::chrono_literals;

/**
 * @brief Minimal printer stand-in: accepts TCP connections on a loopback
 * address and records every byte it receives.
 *
 * Any 127.0.0.x address can be used on Linux, which lets subnet scans be
 * tested against a single known host. With `readData` false the server
 * accepts but never reads, like a jammed printer, so writes to it stall once
 * the socket buffers fill.
 */
class DummyPrinterServer {
public:
    explicit DummyPrinterServer(const std::string& address = "127.0.0.1",
                                std::uint16_t port = 0,
                                bool readData = true)
    : readData_(readData) {
        listenFd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        ASSERT_TRUE(listenFd_ >= 0, "socket");

        int opt = 1;
        ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
        if (!readData_) {
            // Inherited by accepted sockets; keeps the window small.
            int rcvbuf = 4096;
            ::setsockopt(listenFd_, SOL_SOCKET, SO_RCVBUF, &rcvbuf, sizeof(rcvbuf));
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        ::inet_pton(AF_INET, address.c_str(), &addr.sin_addr);
        addr.sin_port = htons(port);

        ASSERT_TRUE(::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0, "bind");
        ASSERT_TRUE(::listen(listenFd_, 16) == 0, "listen");

        socklen_t len = sizeof(addr);
        ASSERT_TRUE(::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0, "getsockname");
        port_ = ntohs(addr.sin_port);

        running_.store(true);
        acceptThread_ = std::thread([this]{ this->acceptLoop(); });
    }

    ~DummyPrinterServer() {
        stop();
    }

    DummyPrinterServer(const DummyPrinterServer&) = delete;
    DummyPrinterServer& operator=(const DummyPrinterServer&) = delete;

    void stop() {
        bool expected = true;
        if (!running_.compare_exchange_strong(expected, false)) {
            return; // already stopped
        }
        ::shutdown(listenFd_, SHUT_RDWR);
        ::close(listenFd_);
        if (acceptThread_.joinable()) {
            acceptThread_.join();
        }
        closeClients();
        std::vector<std::thread> readers;
        std::vector<int> fds;
        {
            std::lock_guard lock(mutex_);
            readers.swap(readers_);
            fds.swap(clients_);
        }
        for (auto& reader : readers) {
            if (reader.joinable()) reader.join();
        }
        for (int fd : fds) {
            ::close(fd);
        }
    }

    /// Orderly close of every accepted connection, as a printer going away would.
    void closeClients() {
        std::lock_guard lock(mutex_);
        for (int fd : clients_) {
            ::shutdown(fd, SHUT_RDWR);
        }
    }

    std::uint16_t port() const { return port_; }

    int connectionsAccepted() const { return acceptedCount_.load(); }

    std::vector<std::uint8_t> received() const {
        std::lock_guard lock(mutex_);
        return received_;
    }

    bool waitForBytes(std::size_t count, std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]{ return received_.size() >= count; });
    }

    bool waitForConnections(int count, std::chrono::milliseconds timeout) {
        std::unique_lock lock(mutex_);
        return cv_.wait_for(lock, timeout, [&]{ return acceptedCount_.load() >= count; });
    }

private:
    void acceptLoop() {
        while (running_.load()) {
            int client = ::accept(listenFd_, nullptr, nullptr);
            if (client < 0) {
                if (!running_.load()) {
                    break;
                }
                std::this_thread::sleep_for(1ms);
                continue;
            }
            std::lock_guard lock(mutex_);
            clients_.push_back(client);
            if (readData_) {
                readers_.emplace_back([this, client]{ this->readLoop(client); });
            }
            acceptedCount_.fetch_add(1);
            cv_.notify_all();
        }
    }

    void readLoop(int fd) {
        std::uint8_t buffer[1024];
        for (;;) {
            const ssize_t n = ::recv(fd, buffer, sizeof(buffer), 0);
            if (n <= 0) {
                return;
            }
            std::lock_guard lock(mutex_);
            received_.insert(received_.end(), buffer, buffer + n);
            cv_.notify_all();
        }
    }

    bool readData_ = true;
    int listenFd_ = -1;
    std::uint16_t port_ = 0;
    std::atomic<bool> running_{false};
    std::atomic<int> acceptedCount_{0};
    std::thread acceptThread_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::vector<int> clients_;
    std::vector<std::thread> readers_;
    std::vector<std::uint8_t> received_;
};

/**
 * @brief Shared control block for FakeProber instances created by one factory.
 *
 * Tests use it to count prober lifecycles and to inject probe outcomes.
 */
class FakeProbeControl : public std::enable_shared_from_this<FakeProbeControl> {
public:
    explicit FakeProbeControl(std::shared_ptr<printlink::net::asio::io_context> io)
    : io_(std::move(io)) {}

    printlink::probe::ProberFactory factory();

    int created() const { return created_.load(); }
    int started() const { return started_.load(); }
    int stopped() const { return stopped_.load(); }

    bool running() const {
        std::lock_guard lock(mutex_);
        return static_cast<bool>(handler_);
    }

    /// Deliver a failed probe on the I/O thread, as the ICMP prober would.
    void fail(std::error_code ec = printlink::core::make_error_code(printlink::core::Errc::ProbeFailure)) {
        printlink::probe::ProbeOutcome outcome;
        outcome.kind = printlink::probe::ProbeOutcome::Kind::Error;
        outcome.error = ec;
        deliver(outcome);
    }

    void reply() {
        deliver(printlink::probe::ProbeOutcome{});
    }

private:
    friend class FakeProber;

    void deliver(const printlink::probe::ProbeOutcome& outcome) {
        printlink::probe::LivenessProber::OutcomeHandler handler;
        {
            std::lock_guard lock(mutex_);
            handler = handler_;
        }
        if (!handler) return;
        printlink::net::asio::post(*io_, [self = shared_from_this(), handler, outcome] {
            {
                std::lock_guard lock(self->mutex_);
                if (!self->handler_) return;  // stopped in the meantime
            }
            handler(outcome);
        });
    }

    std::shared_ptr<printlink::net::asio::io_context> io_;
    mutable std::mutex mutex_;
    printlink::probe::LivenessProber::OutcomeHandler handler_;
    std::atomic<int> created_{0};
    std::atomic<int> started_{0};
    std::atomic<int> stopped_{0};
};

class FakeProber : public printlink::probe::LivenessProber {
public:
    explicit FakeProber(std::shared_ptr<FakeProbeControl> control)
    : control_(std::move(control)) {}

    ~FakeProber() override { stop(); }

    void start(const printlink::net::asio::ip::address_v4&,
               const printlink::probe::ProbeSettings&,
               OutcomeHandler handler) override {
        std::lock_guard lock(control_->mutex_);
        control_->handler_ = std::move(handler);
        control_->started_.fetch_add(1);
        running_ = true;
    }

    void stop() override {
        if (!running_) return;
        running_ = false;
        std::lock_guard lock(control_->mutex_);
        control_->handler_ = nullptr;
        control_->stopped_.fetch_add(1);
    }

    bool running() const override { return running_; }

private:
    std::shared_ptr<FakeProbeControl> control_;
    bool running_ = false;
};

inline printlink::probe::ProberFactory FakeProbeControl::factory() {
    auto self = shared_from_this();
    return [self]() -> std::unique_ptr<printlink::probe::LivenessProber> {
        self->created_.fetch_add(1);
        return std::make_unique<FakeProber>(self);
    };
}

/**
 * @brief Records every value a StatusStream publishes, with arrival time.
 */
class StatusRecorder {
public:
    using Clock = std::chrono::steady_clock;

    explicit StatusRecorder(printlink::core::StatusStream& stream)
    : stream_(stream)
    , log_(std::make_shared<Log>()) {
        // Deliveries already queued may run after unsubscribe, so they hold the log, not `this`.
        id_ = stream_.subscribe([log = log_](printlink::core::ConnectionStatus status) {
            std::lock_guard lock(log->mutex);
            log->values.push_back(status);
            log->times.push_back(Clock::now());
            log->cv.notify_all();
        });
    }

    ~StatusRecorder() {
        stream_.unsubscribe(id_);
    }

    StatusRecorder(const StatusRecorder&) = delete;
    StatusRecorder& operator=(const StatusRecorder&) = delete;

    bool waitFor(std::size_t count, std::chrono::milliseconds timeout = 2000ms) {
        std::unique_lock lock(log_->mutex);
        return log_->cv.wait_for(lock, timeout, [&]{ return log_->values.size() >= count; });
    }

    std::vector<printlink::core::ConnectionStatus> values() const {
        std::lock_guard lock(log_->mutex);
        return log_->values;
    }

    std::size_t count() const {
        std::lock_guard lock(log_->mutex);
        return log_->values.size();
    }

    /// Arrival time of the @p index-th value; only valid once it has arrived.
    Clock::time_point timeOf(std::size_t index) const {
        std::lock_guard lock(log_->mutex);
        return log_->times.at(index);
    }

private:
    struct Log {
        std::mutex mutex;
        std::condition_variable cv;
        std::vector<printlink::core::ConnectionStatus> values;
        std::vector<Clock::time_point> times;
    };

    printlink::core::StatusStream& stream_;
    std::shared_ptr<Log> log_;
    printlink::core::StatusStream::SubscriptionId id_ = 0;
};

} // namespace testsupport
