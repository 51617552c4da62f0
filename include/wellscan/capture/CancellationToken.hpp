#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace wellscan::capture {

/**
 * @brief Cooperative stop flag shared between a capture and its controller.
 *
 * The capture polls stopRequested() between wells and uses waitFor() for
 * settle delays, which returns early once a stop is requested.
 */
class CancellationToken {
public:
    void requestStop();
    bool stopRequested() const { return stopFlag.load(); }

    /// Sleep up to @p timeout. True if a stop was requested before or during the wait.
    bool waitFor(std::chrono::milliseconds timeout);

    void reset();

private:
    std::atomic<bool> stopFlag{false};
    std::mutex mutex;
    std::condition_variable cv;
};

} // namespace wellscan::capture
