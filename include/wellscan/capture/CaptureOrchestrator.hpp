#pragma once

#include "wellscan/calibration/CalibrationEngine.hpp"
#include "wellscan/capture/CancellationToken.hpp"
#include "wellscan/capture/CapturePayload.hpp"
#include "wellscan/motion/MotionConfig.hpp"
#include "wellscan/sensor/SensorDevice.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <optional>

namespace wellscan::motion {
class MotionSession;
}

namespace wellscan::capture {

struct CaptureSettings {
    int feedrate = motion::config::MOTION_DEFAULT_FEEDRATE;
    /// Added to the settle delay when the stage moves to another row.
    std::chrono::milliseconds rowChangeSettle{500};
    /// Replaces move + settle when running without a motion controller.
    std::chrono::milliseconds dummyDelay{500};
};

struct CaptureRequest {
    geometry::CornerSet corners{};
    geometry::WellGrid grid{};
    std::chrono::milliseconds settle{1000};
    /// Dark reference to install before the run; otherwise the engine's current one is kept.
    std::optional<spectral::ChannelVector> dark;
    /// Drive the stage. When false the run only reads the sensor (bench mode).
    bool useMotion = true;
    std::string notes = "per-well blanks captured automatically";
};

enum class CapturePhase : std::uint8_t {
    Moving,
    Settling,
    Capturing,
    Captured,
    Failed
};

const char* toString(CapturePhase phase);

struct CaptureProgress {
    std::size_t index = 0;   ///< 1-based position in the visit order.
    std::size_t total = 0;
    geometry::WellId well{};
    geometry::Point3 position{};
    CapturePhase phase = CapturePhase::Moving;
};

using ProgressCallback = std::function<void(const CaptureProgress&)>;

/**
 * @brief Visits every well in snake order and stores a blank for each.
 *
 * Per well: check the token, move (if motion is enabled) and settle, capture
 * through the CalibrationEngine. A failed move or sensor read marks that well
 * failed and the run continues. Cancellation is observed between protocol
 * operations only, so an issued move always completes; settle delays are cut
 * short.
 *
 * Run-level preconditions (grid, corners, channel width, motion link) fail
 * the whole run before anything moves.
 */
class CaptureOrchestrator {
public:
    CaptureOrchestrator(sensor::SensorDevice& device,
                        calibration::CalibrationEngine& engine,
                        motion::MotionSession* stage = nullptr,
                        CaptureSettings settings = {});

    /**
     * @return The payload of a Completed or Cancelled run. A Failed run
     *         returns the precondition error.
     */
    expected<CapturePayload> run(const CaptureRequest& request,
                                 CancellationToken& token,
                                 const ProgressCallback& progress = {});

    RunStatus status() const { return runStatus.load(); }
    const CaptureSettings& settings() const { return config; }

private:
    expected<void> checkPreconditions(const CaptureRequest& request) const;

    sensor::SensorDevice& device;
    calibration::CalibrationEngine& engine;
    motion::MotionSession* stage;
    const CaptureSettings config;
    std::atomic<RunStatus> runStatus{RunStatus::Idle};
};

} // namespace wellscan::capture
