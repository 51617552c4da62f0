#include "wellscan/capture/CapturePayload.hpp"

namespace wellscan::capture {

const char* toString(RunStatus status) {
    switch (status) {
        case RunStatus::Idle:      return "idle";
        case RunStatus::Running:   return "running";
        case RunStatus::Completed: return "completed";
        case RunStatus::Cancelled: return "cancelled";
        case RunStatus::Failed:    return "failed";
    }
    return "unknown";
}

std::optional<RunStatus> parseRunStatus(const std::string& text) {
    for (auto status : {RunStatus::Idle, RunStatus::Running, RunStatus::Completed,
                        RunStatus::Cancelled, RunStatus::Failed}) {
        if (text == toString(status)) {
            return status;
        }
    }
    return std::nullopt;
}

std::size_t CapturePayload::capturedCount() const {
    std::size_t count = 0;
    for (const auto& entry : blanks) {
        if (entry.second) {
            ++count;
        }
    }
    return count;
}

} // namespace wellscan::capture
