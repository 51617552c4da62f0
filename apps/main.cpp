#include "wellscan/calibration/CalibrationEngine.hpp"
#include "wellscan/calibration/LiveReadout.hpp"
#include "wellscan/capture/CaptureWorker.hpp"
#include "wellscan/motion/MotionSession.hpp"
#include "wellscan/persist/PayloadFile.hpp"
#include "wellscan/sensor/Dummy/DummySensor.hpp"
#include "wellscan/sensor/SpectralReader.hpp"
#include "wellscan/spectral/Channels.hpp"

#include <chrono>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace wellscan;
using namespace std::chrono_literals;

// Usage: wellscan_demo [--port /dev/ttyUSB0] [--save payload.json]
//
// Without --port the capture runs in bench mode (no stage, fixed delay per
// well) against a simulated sensor.
int main(int argc, char** argv) {
    std::string portArg;
    std::string savePath;
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::strcmp(argv[i], "--port") == 0) {
            portArg = argv[++i];
        } else if (std::strcmp(argv[i], "--save") == 0) {
            savePath = argv[++i];
        }
    }

    sensor::dummy::DummySensor sensor;
    calibration::CalibrationEngine engine;

    // 1) References.
    if (auto dark = engine.captureDark(sensor); !dark) {
        std::cerr << "Dark capture failed: " << dark.error().message() << "\n";
        return 1;
    }
    if (auto white = engine.captureWhite(sensor); !white) {
        std::cerr << "White capture failed: " << white.error().message() << "\n";
        return 1;
    }

    // 2) Optional stage.
    std::unique_ptr<motion::MotionSession> stage;
    if (!portArg.empty()) {
        stage = std::make_unique<motion::MotionSession>();
        if (auto port = stage->connect({portArg}); !port) {
            const auto err = port.error();
            std::cerr << "Connect failed: " << err.message()
                      << " (" << err.category().name() << ":" << err.value() << ")\n";
            return 1;
        }
        if (auto homed = stage->home(); !homed) {
            std::cerr << "Homing failed: " << homed.error().message() << "\n";
            return 1;
        }
    }

    // 3) Blank capture over a small plate.
    capture::CaptureRequest request;
    request.grid = geometry::WellGrid{2, 3};
    request.corners.set(geometry::Corner::TopLeft, {20.0, 20.0, 10.0});
    request.corners.set(geometry::Corner::TopRight, {38.0, 20.0, 10.0});
    request.corners.set(geometry::Corner::BottomLeft, {20.0, 29.0, 10.0});
    request.corners.set(geometry::Corner::BottomRight, {38.0, 29.0, 10.0});
    request.useMotion = static_cast<bool>(stage);

    capture::CaptureSettings settings;
    settings.dummyDelay = 200ms;
    capture::CaptureOrchestrator orchestrator(sensor, engine, stage.get(), settings);
    capture::CaptureWorker worker(orchestrator);

    worker.start(request, [](const capture::CaptureProgress& p) {
        std::cout << "[" << p.index << "/" << p.total << "] " << p.well.toString()
                  << " " << capture::toString(p.phase) << "\n";
    });
    if (!worker.waitFor(5min)) {
        worker.requestStop();
        worker.waitFor(30s);
    }

    auto result = worker.takeResult();
    if (!result || !*result) {
        std::cerr << "Capture failed: "
                  << (result ? result->error().message() : std::string("no result")) << "\n";
        return 1;
    }
    const auto& payload = **result;
    std::cout << "Capture " << capture::toString(payload.status) << ": "
              << payload.capturedCount() << " blank(s), "
              << payload.failedWells.size() << " failed\n";

    if (!savePath.empty()) {
        if (auto saved = persist::savePayload(savePath, payload); !saved) {
            std::cerr << "Save failed: " << saved.error().message() << "\n";
        }
    }

    // 4) Live readout at A1 with a sample absorbing half the light.
    sensor.setSampleFactor(0.5);
    const geometry::WellId a1{0, 0};
    const std::size_t focus[] = {spectral::findChannel("F5"),
                                 spectral::findChannel("FXL"),
                                 spectral::findChannel("F6")};

    calibration::LiveReadout readout(engine);
    for (int tick = 0; tick < 20; ++tick) {
        if (tick % 4 == 0) {
            std::cout << "Mode " << calibration::toString(engine.cycleMode()) << "\n";
        }
        auto frame = sensor::readFrame(sensor);
        if (!frame) {
            continue;
        }
        auto reduced = readout.update(*frame, a1);
        if (!reduced) {
            std::cerr << "Reduce failed: " << reduced.error().message() << "\n";
            continue;
        }
        std::cout << std::fixed << std::setprecision(4);
        for (std::size_t index : focus) {
            std::cout << "  " << spectral::kChannelLabels[index] << "=" << reduced->values[index];
            if (!reduced->percent.empty()) {
                std::cout << " (" << std::setprecision(2) << reduced->percent[index] << "%)"
                          << std::setprecision(4);
            }
        }
        std::cout << "\n";
        std::this_thread::sleep_for(100ms);
    }

    if (stage) {
        stage->disconnect();
    }
    std::cout << "Done." << std::endl;
    return 0;
}
