#pragma once
#include "printlink/net/NetConfig.hpp"
#include "printlink/log/Log.hpp"

#include <condition_variable>
#include <memory>
#include <mutex>

/**
 * @brief Run an async operation with a deadline enforced by an Asio timer.
 *
 * Pattern:
 * - Post to @p ex a step that starts the operation and arms an
 *   `asio::steady_timer`, so both are touched only on that executor.
 * - Whichever completes first cancels the other and signals a condition
 *   variable so this call can return synchronously with a timeout.
 *
 * Safety notes:
 * - Completion handlers capture a `shared_ptr<State>` so they cannot access
 *   destroyed synchronisation primitives even if they run after this function
 *   returns. Handlers passed to the operation must not reference the caller's
 *   stack for the same reason; copy buffers into shared storage instead.
 * - The `cancel()` functor runs on @p ex and must cancel the object that
 *   launched the operation.
 *
 * Requirements:
 * - The associated `asio::io_context` must be running on another thread.
 *   Calling this from the I/O thread itself would wait forever.
 */
namespace printlink::net {

template<typename Executor, typename StartAsync, typename Cancel>
std::error_code with_deadline(
    const Executor& ex,
    duration timeout,
    StartAsync start_async,
    Cancel cancel)
{
    struct State {
        std::mutex m;
        std::condition_variable cv;
        bool done = false;
        bool expired = false;
        std::error_code ec = asio::error::would_block;
    };

    auto st = std::make_shared<State>();
    auto timer = std::make_shared<asio::steady_timer>(ex);

    // Completion of the user async op
    auto op_handler = [st, timer](const std::error_code& op_ec, auto&&... /*ignored*/) {
        {
            std::lock_guard<std::mutex> lk(st->m);
            if (st->done || st->expired) return;    // the deadline already won
            st->ec = op_ec;
            st->done = true;
        }
        st->cv.notify_one();
        timer->cancel();
    };

    asio::post(ex, [st, timer, timeout, op_handler, start_async, cancel]() mutable {
        start_async(op_handler);

        timer->expires_after(timeout);
        timer->async_wait([st, cancel, timeout](const std::error_code& tec) mutable {
            if (tec == asio::error::operation_aborted) {
                return;                     // operation finished first
            }
            {
                std::lock_guard<std::mutex> lk(st->m);
                if (st->done) return;
                st->expired = true;
            }
            logDebug("[with_deadline] timeout fired after ", timeout.count(), "ms\n");
            // The caller stays blocked until cancel() has returned.
            cancel();
            {
                std::lock_guard<std::mutex> lk(st->m);
                st->ec = asio::error::timed_out;
                st->done = true;
            }
            st->cv.notify_one();
        });
    });

    std::unique_lock<std::mutex> lk(st->m);
    st->cv.wait(lk, [&]{ return st->done; });
    return st->ec;
}

} // namespace printlink::net
