#pragma once
#include "wellscan/io/IoConfig.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <memory>

namespace wellscan::io {

/**
 * @brief Run an async operation with a deadline enforced by an Asio timer.
 *
 * Pattern:
 * - Start an async operation and an `asio::steady_timer` on the same executor.
 * - Whichever completes first cancels the other and signals a condition
 *   variable so this call can return synchronously.
 *
 * The result is the operation's error code, or `asio::error::timed_out` when
 * the timer won.
 *
 * Safety notes:
 * - Completion handlers capture a `shared_ptr<State>`, so they never touch
 *   destroyed synchronisation primitives even if they run after this
 *   function has returned.
 * - `start_async` receives a completion functor taking the operation's
 *   error code plus any extra arguments; extra arguments are ignored here,
 *   so callers that need them (bytes transferred) must capture shared state.
 * - The associated `io_context` must be running while we block.
 */
template<typename StartAsync, typename Cancel>
std::error_code with_deadline(
    asio::any_io_executor ex,
    std::chrono::milliseconds timeout,
    StartAsync start_async,
    Cancel cancel)
{
    struct State {
        std::mutex m;
        std::condition_variable cv;
        bool done = false;
        std::error_code ec = asio::error::would_block;
    };

    auto st = std::make_shared<State>();
    auto timer = std::make_shared<asio::steady_timer>(ex);

    auto op_handler = [st, timer](const std::error_code& op_ec, auto&&... /*ignored*/) {
        {
            std::lock_guard<std::mutex> lk(st->m);
            if (st->done) return;           // the timer already won
            st->ec = op_ec;
            st->done = true;
        }
        st->cv.notify_one();
        timer->cancel();
    };

    start_async(op_handler);

    timer->expires_after(timeout);
    timer->async_wait([st, cancel, timer](const std::error_code& tec){
        if (tec == asio::error::operation_aborted) {
            return;
        }
        {
            std::lock_guard<std::mutex> lk(st->m);
            if (st->done) {
                return;
            }
            st->ec = asio::error::timed_out;
            st->done = true;
        }
        cancel();
        st->cv.notify_one();
    });

    std::unique_lock<std::mutex> lk(st->m);
    st->cv.wait(lk, [&]{ return st->done; });
    return st->ec;
}

} // namespace wellscan::io
