#pragma once
#include "printlink/net/NetConfig.hpp"
#include <memory>
#include <thread>

namespace printlink::net {

/**
 * @brief RAII wrapper around `asio::io_context` that runs a dedicated I/O thread.
 *
 * Every socket, timer and ICMP operation in printlink is driven by this loop.
 * Public calls block their own thread while the I/O thread completes the work,
 * so the loop itself never waits on a caller.
 *
 * Lifetime notes:
 * - Destroy connectors, scans and probers before the `NetService` they use so
 *   their handlers complete while the `io_context` is still running.
 * - The destructor releases the work guard, calls `stop()`, and joins the thread.
 *
 * `shared_io_context()` returns a lazily created process-wide service for
 * callers that do not want to own one.
 */
class NetService {
public:
    NetService();
    ~NetService();

    NetService(const NetService&) = delete;
    NetService& operator=(const NetService&) = delete;
    NetService(NetService&&) = delete;
    NetService& operator=(NetService&&) = delete;

    std::shared_ptr<asio::io_context> io() { return io_; }

private:
    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread t_;
};

NetService& ensureNetService();
std::shared_ptr<asio::io_context> shared_io_context();

} // namespace printlink::net
