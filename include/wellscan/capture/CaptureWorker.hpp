#pragma once

#include "wellscan/capture/CaptureOrchestrator.hpp"

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>

namespace wellscan::capture {

/**
 * @brief Runs a CaptureOrchestrator on a background thread.
 *
 * Threading model:
 * - start() launches one run; a second start() while it is running is refused.
 * - requestStop() sets the shared cancellation token; the run finishes the
 *   operation in flight and returns a Cancelled payload.
 * - waitFor() is a bounded join: it returns false if the run is still busy
 *   when the timeout expires (a settle move can take up to the settle timeout).
 * - The destructor requests a stop and waits up to `shutdownGrace` quietly.
 *   A run still busy after that (a move blocked on its settle timeout) is
 *   logged and then joined, so callers that must not block should requestStop()
 *   and waitFor() themselves before destruction.
 */
class CaptureWorker {
public:
    using Result = expected<CapturePayload>;

    explicit CaptureWorker(CaptureOrchestrator& orchestrator,
                           std::chrono::milliseconds shutdownGrace = std::chrono::milliseconds{2000});
    ~CaptureWorker();

    CaptureWorker(const CaptureWorker&) = delete;
    CaptureWorker& operator=(const CaptureWorker&) = delete;

    bool start(CaptureRequest request, ProgressCallback progress = {});
    void requestStop();
    bool waitFor(std::chrono::milliseconds timeout);

    bool isRunning() const;
    RunStatus status() const { return orchestrator.status(); }

    /// The finished run's result, once; std::nullopt while running or already taken.
    std::optional<Result> takeResult();

private:
    void joinIfFinished();

    CaptureOrchestrator& orchestrator;
    const std::chrono::milliseconds shutdownGrace;
    CancellationToken token;

    mutable std::mutex mutex;
    std::condition_variable finishedCv;
    bool running = false;
    std::optional<Result> result;
    std::thread worker;
};

} // namespace wellscan::capture
