#pragma once

#include "wirecast/log/Log.hpp"
#include "wirecast/net/NetConfig.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace wirecast::net {

/**
 * @brief Blocks until an async operation completes or a timer expires.
 *
 * start_async(completion) launches the operation and must eventually call
 * completion(error_code). A steady_timer on the same executor races it; when
 * the timer wins, cancel() is called (it must cancel that same operation) and
 * asio::error::timed_out is returned.
 *
 * The call returns only after the operation's own completion has run, so its
 * buffers and the stream may be destroyed as soon as it returns. cancel() runs
 * under the state lock and must not wait for handlers. The executor's
 * io_context must be running on another thread.
 */
template<typename StartAsync, typename Cancel>
std::error_code with_deadline(asio::any_io_executor ex,
                              std::chrono::milliseconds timeout,
                              StartAsync start_async,
                              Cancel cancel) {
    struct State {
        std::mutex m;
        std::condition_variable cv;
        bool completed = false;
        bool timedOut = false;
        std::error_code ec = asio::error::would_block;
    };

    auto st = std::make_shared<State>();
    auto timer = std::make_shared<asio::steady_timer>(ex);

    start_async([st, timer](const std::error_code& op_ec, auto&&...) {
        {
            std::lock_guard<std::mutex> lk(st->m);
            st->ec = op_ec;
            st->completed = true;
        }
        st->cv.notify_one();
        timer->cancel();
    });

    timer->expires_after(timeout);
    timer->async_wait([st, timer, cancel, timeout](const std::error_code& tec) {
        if (tec == asio::error::operation_aborted) return;
        {
            std::lock_guard<std::mutex> lk(st->m);
            if (st->completed) return;
            st->timedOut = true;
            cancel();
        }
        logError("[wirecast] deadline of ", timeout.count(), "ms expired\n");
    });

    std::unique_lock<std::mutex> lk(st->m);
    st->cv.wait(lk, [&] { return st->completed; });
    // An operation that finished before the cancel landed keeps its result.
    if (st->timedOut && st->ec) {
        return asio::error::timed_out;
    }
    return st->ec;
}

} // namespace wirecast::net
