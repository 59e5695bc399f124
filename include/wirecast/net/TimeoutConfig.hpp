#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace wirecast::net {

/**
 * @brief Process-wide default deadline for the blocking byteable reads and writes.
 *
 * Starts at one second. Negative values are clamped to zero, which makes a
 * blocking call fail with asio::error::timed_out unless its bytes are already
 * in flight.
 */
class TimeoutConfig {
public:
    using duration = std::chrono::milliseconds;

    static void setDefault(duration timeout) {
        storage().store(sanitize(timeout).count());
    }

    static duration defaultTimeout() {
        return duration{storage().load()};
    }

    // Restores the previous default when it goes out of scope.
    class ScopedOverride {
    public:
        explicit ScopedOverride(duration timeout)
        : previous_(defaultTimeout()) {
            setDefault(timeout);
        }

        ScopedOverride(const ScopedOverride&) = delete;
        ScopedOverride& operator=(const ScopedOverride&) = delete;

        ~ScopedOverride() {
            setDefault(previous_);
        }

    private:
        duration previous_;
    };

    static duration sanitize(duration timeout) {
        return timeout.count() < 0 ? duration::zero() : timeout;
    }

private:
    static std::atomic<std::int64_t>& storage() {
        static std::atomic<std::int64_t> timeoutMs{1000};
        return timeoutMs;
    }
};

} // namespace wirecast::net
