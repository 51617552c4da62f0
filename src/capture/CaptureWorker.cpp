#include "wellscan/capture/CaptureWorker.hpp"
#include "wellscan/log/Log.hpp"

namespace wellscan::capture {

CaptureWorker::CaptureWorker(CaptureOrchestrator& orchestrator,
                             std::chrono::milliseconds shutdownGrace)
: orchestrator(orchestrator)
, shutdownGrace(shutdownGrace) {}

CaptureWorker::~CaptureWorker() {
    if (!worker.joinable()) {
        return;
    }
    requestStop();
    if (!waitFor(shutdownGrace)) {
        logError("[CaptureWorker] waiting for the operation in flight before shutdown\n");
        worker.join();
        logInfo("[CaptureWorker] capture stopped\n");
    }
}

bool CaptureWorker::start(CaptureRequest request, ProgressCallback progress) {
    std::unique_lock<std::mutex> lock(mutex);
    if (running) {
        logError("[CaptureWorker] start() refused: a capture is already running\n");
        return false;
    }
    // A previous run has finished; reap its thread before reusing the slot.
    if (worker.joinable()) {
        lock.unlock();
        worker.join();
        lock.lock();
    }

    token.reset();
    result.reset();
    running = true;
    worker = std::thread([this, request = std::move(request), progress = std::move(progress)] {
        auto outcome = orchestrator.run(request, token, progress);
        {
            std::lock_guard<std::mutex> done(mutex);
            result = std::move(outcome);
            running = false;
        }
        finishedCv.notify_all();
    });
    return true;
}

void CaptureWorker::requestStop() {
    logInfo("[CaptureWorker] stop requested\n");
    token.requestStop();
}

bool CaptureWorker::waitFor(std::chrono::milliseconds timeout) {
    {
        std::unique_lock<std::mutex> lock(mutex);
        if (!finishedCv.wait_for(lock, timeout, [this] { return !running; })) {
            logError("[CaptureWorker] capture still running after ", timeout.count(), "ms\n");
            return false;
        }
    }
    joinIfFinished();
    return true;
}

bool CaptureWorker::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex);
    return running;
}

std::optional<CaptureWorker::Result> CaptureWorker::takeResult() {
    std::lock_guard<std::mutex> lock(mutex);
    if (running || !result) {
        return std::nullopt;
    }
    auto out = std::move(result);
    result.reset();
    return out;
}

void CaptureWorker::joinIfFinished() {
    if (worker.joinable() && !isRunning()) {
        worker.join();
    }
}

} // namespace wellscan::capture
