#include "wellscan/capture/CaptureOrchestrator.hpp"

#include "wellscan/core/Error.hpp"
#include "wellscan/core/Timestamp.hpp"
#include "wellscan/log/Log.hpp"
#include "wellscan/motion/MotionSession.hpp"
#include "wellscan/spectral/Channels.hpp"

namespace wellscan::capture {

using geometry::WellId;

const char* toString(CapturePhase phase) {
    switch (phase) {
        case CapturePhase::Moving:    return "moving";
        case CapturePhase::Settling:  return "settling";
        case CapturePhase::Capturing: return "capturing";
        case CapturePhase::Captured:  return "captured";
        case CapturePhase::Failed:    return "failed";
    }
    return "unknown";
}

CaptureOrchestrator::CaptureOrchestrator(sensor::SensorDevice& device,
                                         calibration::CalibrationEngine& engine,
                                         motion::MotionSession* stage,
                                         CaptureSettings settings)
: device(device)
, engine(engine)
, stage(stage)
, config(settings) {}

expected<void> CaptureOrchestrator::checkPreconditions(const CaptureRequest& request) const {
    if (!request.grid.valid()) {
        logError("[CaptureOrchestrator] invalid grid ", request.grid.rows, "x", request.grid.cols, "\n");
        return unexpected(make_error_code(Errc::InvalidGrid));
    }
    if (!request.corners.complete()) {
        std::string names;
        for (auto corner : request.corners.missing()) {
            names += names.empty() ? "" : ", ";
            names += geometry::cornerName(corner);
        }
        logError("[CaptureOrchestrator] corners not set: ", names, "\n");
        return unexpected(make_error_code(Errc::IncompleteCorners));
    }
    if (device.channelCount() != spectral::kChannelCount) {
        logError("[CaptureOrchestrator] sensor reports ", device.channelCount(),
                 " channels, expected ", spectral::kChannelCount, "\n");
        return unexpected(make_error_code(Errc::ChannelLengthMismatch));
    }
    if (request.useMotion && (stage == nullptr || !stage->isConnected())) {
        logError("[CaptureOrchestrator] motion requested but the controller is not connected\n");
        return unexpected(make_error_code(Errc::NotConnected));
    }
    return {};
}

expected<CapturePayload> CaptureOrchestrator::run(const CaptureRequest& request,
                                                  CancellationToken& token,
                                                  const ProgressCallback& progress) {
    runStatus = RunStatus::Running;

    if (auto ready = checkPreconditions(request); !ready) {
        runStatus = RunStatus::Failed;
        return unexpected(ready.error());
    }

    auto positions = geometry::calculateWellPositions(request.corners, request.grid);
    if (!positions) {
        runStatus = RunStatus::Failed;
        return unexpected(positions.error());
    }

    if (request.dark) {
        engine.setDark(request.dark);
    }

    CapturePayload payload;
    payload.timestamp = isoTimestamp();
    payload.notes = request.notes;
    payload.labels = spectral::channelLabels();
    payload.eps = engine.settings().eps;
    payload.grid = request.grid;
    payload.corners = request.corners;
    payload.positions = *positions;
    for (const auto& well : geometry::allWells(request.grid)) {
        payload.blanks[well] = std::nullopt;
    }

    const auto order = geometry::generateVisitOrder(request.grid);
    const std::size_t total = order.size();
    logInfo("[CaptureOrchestrator] capturing ", total, " wells (", request.grid.rows, "x",
            request.grid.cols, ", ", request.useMotion ? "motion" : "no motion", ")\n");

    auto report = [&](std::size_t index, const WellId& well, const geometry::Point3& position,
                      CapturePhase phase) {
        if (progress) {
            progress(CaptureProgress{index, total, well, position, phase});
        }
    };

    bool cancelled = false;
    std::optional<WellId> previous;
    for (std::size_t i = 0; i < total && !cancelled; ++i) {
        const WellId& well = order[i];
        const std::size_t index = i + 1;

        if (token.stopRequested()) {
            cancelled = true;
            break;
        }

        const auto& position = payload.positions.at(well);
        logInfo("[CaptureOrchestrator] [", index, "/", total, "] ", well.toString(),
                " at ", geometry::formatPoint(position), "\n");

        const bool rowChange = previous && geometry::isRowChange(*previous, well);
        previous = well;

        if (request.useMotion) {
            report(index, well, position, CapturePhase::Moving);
            auto moved = stage->moveTo(position, config.feedrate);
            if (!moved) {
                logError("[CaptureOrchestrator] move to ", well.toString(), " failed: ",
                         moved.error().message(), "\n");
                payload.failedWells.push_back(well);
                payload.visitedWells.push_back(well);
                report(index, well, position, CapturePhase::Failed);
                continue;
            }

            auto settle = request.settle;
            if (rowChange) {
                settle += config.rowChangeSettle;
            }
            report(index, well, position, CapturePhase::Settling);
            if (token.waitFor(settle)) {
                cancelled = true;
                break;
            }
        } else if (token.waitFor(config.dummyDelay)) {
            cancelled = true;
            break;
        }

        report(index, well, position, CapturePhase::Capturing);
        payload.visitedWells.push_back(well);
        auto blank = engine.captureBlank(well, device);
        if (!blank) {
            logError("[CaptureOrchestrator] capture at ", well.toString(), " failed: ",
                     blank.error().message(), "\n");
            payload.failedWells.push_back(well);
            report(index, well, position, CapturePhase::Failed);
            continue;
        }
        payload.blanks[well] = std::move(*blank);
        report(index, well, position, CapturePhase::Captured);
    }

    if (auto dark = engine.snapshot().dark) {
        payload.dark = *dark;
    }

    payload.status = cancelled ? RunStatus::Cancelled : RunStatus::Completed;
    runStatus = payload.status;

    logInfo("[CaptureOrchestrator] ", toString(payload.status), ": ", payload.capturedCount(),
            " of ", total, " blanks captured, ", payload.failedWells.size(), " failed, dark ",
            payload.dark ? "yes" : "no", "\n");
    return payload;
}

} // namespace wellscan::capture
