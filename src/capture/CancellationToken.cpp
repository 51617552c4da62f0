#include "wellscan/capture/CancellationToken.hpp"

namespace wellscan::capture {

void CancellationToken::requestStop() {
    {
        std::lock_guard<std::mutex> lock(mutex);
        stopFlag = true;
    }
    cv.notify_all();
}

bool CancellationToken::waitFor(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex);
    return cv.wait_for(lock, timeout, [this] { return stopFlag.load(); });
}

void CancellationToken::reset() {
    std::lock_guard<std::mutex> lock(mutex);
    stopFlag = false;
}

} // namespace wellscan::capture
