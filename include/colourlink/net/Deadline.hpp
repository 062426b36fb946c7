#pragma once
#include "colourlink/net/NetConfig.hpp"
#include "colourlink/net/TimeoutConfig.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <memory>

/**
 * @brief Run an async operation and block until it completes or a deadline expires.
 *
 * Pattern:
 * - Start an async operation and an `asio::steady_timer` on the same executor.
 * - Whichever completes first cancels the other and signals a condition
 *   variable so this call can return synchronously with a timeout.
 * - With `TimeoutConfig::NO_DEADLINE` no timer is armed; the call returns
 *   only when the operation completes or is cancelled from elsewhere.
 *
 * Safety notes:
 * - Completion handlers capture a `shared_ptr<State>`, including the byte
 *   count, so a late completion never touches the caller's stack.
 * - The `cancel()` functor must cancel the same socket that launched the
 *   operation. It runs on the timer's executor.
 *
 * Requirements:
 * - The associated `asio::io_context` must already be running while we block.
 */
namespace colourlink::net {

template<typename StartAsync, typename Cancel>
std::error_code with_deadline(
    asio::any_io_executor ex,
    std::chrono::milliseconds timeout,
    StartAsync start_async,
    Cancel cancel,
    std::size_t* bytesTransferredOut = nullptr)
{
    struct State {
        std::mutex m;
        std::condition_variable cv;
        bool done = false;
        std::error_code ec = asio::error::would_block;
        std::size_t transferred = 0;
    };

    auto st = std::make_shared<State>();
    auto timer = std::make_shared<asio::steady_timer>(ex);

    auto op_handler = [st, timer](const std::error_code& op_ec, std::size_t transferred = 0) {
        {
            std::lock_guard<std::mutex> lk(st->m);
            st->transferred = transferred;
            if (st->done) return;           // deadline already won
            st->ec = op_ec;
            st->done = true;
        }
        st->cv.notify_one();
        asio::post(timer->get_executor(), [timer]{ timer->cancel(); });
    };

    start_async(op_handler);

    if (TimeoutConfig::hasDeadline(timeout)) {
        asio::post(ex, [st, cancel, timer, timeout]{
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
        });
    }

    std::unique_lock<std::mutex> lk(st->m);
    st->cv.wait(lk, [&]{ return st->done; });
    if (bytesTransferredOut) {
        *bytesTransferredOut = st->transferred;
    }
    return st->ec;
}

} // namespace colourlink::net
