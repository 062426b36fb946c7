#pragma once

#include <chrono>

namespace colourlink::net {

/**
 * @brief Timeout conventions shared by the synchronous socket helpers.
 *
 * `NO_DEADLINE` disables the timer entirely; the operation then waits for
 * completion or cancellation.
 */
class TimeoutConfig {
public:
    using duration = std::chrono::milliseconds;

    static constexpr duration NO_DEADLINE = duration::max();

    static bool hasDeadline(duration timeout) {
        return timeout != NO_DEADLINE;
    }

    /** Negative timeouts are clamped to zero. */
    static duration sanitize(duration timeout) {
        return timeout.count() < 0 ? duration::zero() : timeout;
    }
};

} // namespace colourlink::net
