#pragma once

#include <chrono>

namespace wellscan::io {

/**
 * @brief Process-wide default deadline for blocking stream helpers.
 *
 * SerialPort picks this up at construction; MotionSession overrides it per
 * operation from MotionTimeouts.
 */
class TimeoutConfig {
public:
    using duration = std::chrono::milliseconds;

    static duration defaultTimeout() {
        return storage();
    }

    /** RAII helper that temporarily overrides the default timeout. */
    class ScopedOverride {
    public:
        explicit ScopedOverride(duration timeout)
        : previous_(storage()) {
            storage() = sanitize(timeout);
        }

        ScopedOverride(const ScopedOverride&) = delete;
        ScopedOverride& operator=(const ScopedOverride&) = delete;

        ~ScopedOverride() {
            storage() = previous_;
        }

    private:
        duration previous_;
    };

    static duration sanitize(duration timeout) {
        return timeout.count() < 0 ? duration::zero() : timeout;
    }

private:
    static duration& storage() {
        static duration timeout{duration{500}};
        return timeout;
    }
};

} // namespace wellscan::io
