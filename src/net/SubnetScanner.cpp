#include "printlink/net/SubnetScanner.hpp"
#include "printlink/log/Log.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <set>

namespace printlink::net {

namespace detail {

/**
 * Shared between the consumer thread (ScanStream) and the handlers running on
 * the scan's strand. `mutex` guards the result queue and the `closed` flag;
 * everything below the strand comment is only touched on the strand.
 */
struct ScanJob : std::enable_shared_from_this<ScanJob> {
    struct Attempt {
        Attempt(const asio::strand<asio::io_context::executor_type>& strand, core::Endpoint ep)
        : socket(strand), timer(strand), endpoint(ep) {}

        tcp::socket socket;
        asio::steady_timer timer;
        core::Endpoint endpoint;
    };

    ScanJob(std::shared_ptr<asio::io_context> ioContext,
            std::vector<asio::ip::address_v4> hostList,
            std::uint16_t targetPort,
            duration attemptTimeout,
            int maxInFlightAttempts)
    : io(std::move(ioContext))
    , strand(asio::make_strand(*io))
    , hosts(std::move(hostList))
    , port(targetPort)
    , timeout(attemptTimeout)
    , maxInFlight(std::max(1, maxInFlightAttempts))
    {}

    // Consumer side ----------------------------------------------------------
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<core::Endpoint> ready;
    bool closed = false;
    int settled = 0;

    void push(const core::Endpoint& endpoint) {
        {
            std::lock_guard lock(mutex);
            if (closed) return;
            ready.push_back(endpoint);
        }
        cv.notify_all();
    }

    void close() {
        {
            std::lock_guard lock(mutex);
            closed = true;
        }
        cv.notify_all();
    }

    // Strand side ------------------------------------------------------------
    std::shared_ptr<asio::io_context> io;
    asio::strand<asio::io_context::executor_type> strand;
    std::vector<asio::ip::address_v4> hosts;
    std::uint16_t port;
    duration timeout;
    int maxInFlight;
    std::size_t nextHost = 0;
    int inFlight = 0;
    bool cancelled = false;
    std::set<std::shared_ptr<Attempt>> attempts;

    void start() {
        if (hosts.empty()) {
            close();
            return;
        }
        asio::post(strand, [self = shared_from_this()] { self->launchMore(); });
    }

    void launchMore() {
        while (!cancelled && inFlight < maxInFlight && nextHost < hosts.size()) {
            launch(core::Endpoint(hosts[nextHost++], port));
        }
    }

    void launch(const core::Endpoint& endpoint) {
        auto attempt = std::make_shared<Attempt>(strand, endpoint);
        attempts.insert(attempt);
        ++inFlight;

        attempt->timer.expires_after(timeout);
        attempt->timer.async_wait([attempt](const std::error_code& ec) {
            if (ec == asio::error::operation_aborted) return;
            std::error_code ignored;
            attempt->socket.close(ignored);   // completes the connect with operation_aborted
        });

        attempt->socket.async_connect(endpoint.toTcp(),
            [self = shared_from_this(), attempt](const std::error_code& ec) {
                attempt->timer.cancel();
                if (!ec && !self->cancelled) {
                    logDebug("[SubnetScanner] ", attempt->endpoint.toString(), " accepted\n");
                    self->push(attempt->endpoint);
                }
                std::error_code ignored;
                attempt->socket.close(ignored);
                self->attempts.erase(attempt);
                self->settle();
            });
    }

    void settle() {
        --inFlight;
        bool finished = false;
        {
            std::lock_guard lock(mutex);
            ++settled;
            finished = static_cast<std::size_t>(settled) == hosts.size();
        }
        if (finished || (cancelled && inFlight == 0)) {
            close();
            return;
        }
        launchMore();
    }

    void cancel() {
        close();
        asio::post(strand, [self = shared_from_this()] {
            self->cancelled = true;
            for (const auto& attempt : self->attempts) {
                std::error_code ignored;
                attempt->timer.cancel();
                attempt->socket.close(ignored);
            }
        });
    }
};

} // namespace detail

ScanStream::~ScanStream() {
    cancel();
}

ScanStream& ScanStream::operator=(ScanStream&& other) noexcept {
    if (this != &other) {
        cancel();
        job_ = std::move(other.job_);
    }
    return *this;
}

std::optional<core::Endpoint> ScanStream::next() {
    if (!job_) {
        return std::nullopt;
    }
    if (job_->io->get_executor().running_in_this_thread()) {
        logError("[SubnetScanner] next() called from the I/O thread\n");
        return std::nullopt;
    }
    std::unique_lock lock(job_->mutex);
    job_->cv.wait(lock, [this]{ return !job_->ready.empty() || job_->closed; });
    if (job_->ready.empty()) {
        return std::nullopt;
    }
    auto endpoint = job_->ready.front();
    job_->ready.pop_front();
    return endpoint;
}

std::vector<core::Endpoint> ScanStream::collect() {
    std::vector<core::Endpoint> endpoints;
    while (auto endpoint = next()) {
        endpoints.push_back(*endpoint);
    }
    return endpoints;
}

void ScanStream::cancel() {
    if (!job_) return;
    bool alreadyClosed = false;
    {
        std::lock_guard lock(job_->mutex);
        alreadyClosed = job_->closed;
    }
    if (!alreadyClosed) {
        logDebug("[SubnetScanner] scan cancelled\n");
        job_->cancel();
    }
}

int ScanStream::settledCount() const {
    if (!job_) return 0;
    std::lock_guard lock(job_->mutex);
    return job_->settled;
}

ScanStream SubnetScanner::scan(std::string_view prefix,
                               std::uint16_t port,
                               duration timeout,
                               int maxInFlight) {
    auto network = core::parseSubnetPrefix(prefix);
    if (!network) {
        logError("[SubnetScanner] invalid subnet prefix '", prefix, "'\n");
        auto job = std::make_shared<detail::ScanJob>(io_, std::vector<asio::ip::address_v4>{},
                                                     port, timeout, maxInFlight);
        job->start();
        return ScanStream(std::move(job));
    }
    return scan(*network, port, timeout, maxInFlight);
}

ScanStream SubnetScanner::scan(const asio::ip::address_v4& network,
                               std::uint16_t port,
                               duration timeout,
                               int maxInFlight) {
    const auto effectiveTimeout = timeout.count() < 0 ? duration::zero() : timeout;
    logInfo("[SubnetScanner] scanning ", network.to_string(), "/24 port ", port,
            " timeout=", effectiveTimeout.count(), "ms\n");

    auto job = std::make_shared<detail::ScanJob>(io_, core::hostsInSubnet(network),
                                                 port, effectiveTimeout, maxInFlight);
    job->start();
    return ScanStream(std::move(job));
}

} // namespace printlink::net
