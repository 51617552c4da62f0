#include "TestSupport.hpp"

#include "wellscan/calibration/CalibrationEngine.hpp"
#include "wellscan/calibration/LiveReadout.hpp"
#include "wellscan/core/Error.hpp"
#include "wellscan/sensor/Dummy/DummySensor.hpp"
#include "wellscan/sensor/SpectralReader.hpp"

#include <cmath>

using namespace wellscan;
using namespace wellscan::calibration;
using wellscan::geometry::WellGrid;
using wellscan::geometry::WellId;

static CalibrationSettings fastSettings() {
    CalibrationSettings settings;
    settings.darkSettle = std::chrono::milliseconds{0};
    settings.flushGap = std::chrono::milliseconds{0};
    settings.lightSettle = std::chrono::milliseconds{0};
    return settings;
}

static ChannelVector filled(double value, std::size_t width = 13) {
    return ChannelVector(width, value);
}

static WellId well(const char* text) {
    return *WellId::parse(text);
}

static void testModeCycle() {
    Mode mode = Mode::Raw;
    const char* names[] = {"REFLECTANCE", "ABSORBANCE", "TRANSMITTANCE", "ABS_TX", "RAW"};
    for (const char* name : names) {
        mode = nextMode(mode);
        ASSERT_EQ(std::string(toString(mode)), std::string(name), "cycle order");
    }
    ASSERT_TRUE(parseMode("abs_tx") == Mode::AbsTx, "parse ignores case");
    ASSERT_TRUE(!parseMode("percent"), "unknown mode");

    CalibrationEngine engine(fastSettings());
    ASSERT_TRUE(engine.mode() == Mode::Raw, "starts in RAW");
    ASSERT_TRUE(engine.cycleMode() == Mode::Reflectance, "cycle advances");
    engine.setDark(filled(10.0));
    engine.setMode(Mode::AbsTx);
    ASSERT_TRUE(engine.snapshot().dark != nullptr, "mode change keeps references");
}

static void testMissingReferencesGiveZeros() {
    CalibrationEngine engine(fastSettings());
    const auto raw = filled(500.0);

    auto passthrough = engine.reduce(raw, Mode::Raw);
    ASSERT_TRUE(passthrough && passthrough->values == raw, "RAW passes through");
    ASSERT_TRUE(passthrough->percent.empty(), "RAW has no percent column");

    for (Mode mode : {Mode::Reflectance, Mode::Absorbance}) {
        auto out = engine.reduce(raw, mode);
        ASSERT_TRUE(out && out->values == filled(0.0) && out->percent == filled(0.0), "no white -> zeros");
    }
    for (Mode mode : {Mode::Transmittance, Mode::AbsTx}) {
        auto noWell = engine.reduce(raw, mode);
        ASSERT_TRUE(noWell && noWell->values == filled(0.0), "no well selected -> zeros");
        auto noBlank = engine.reduce(raw, mode, well("A1"));
        ASSERT_TRUE(noBlank && noBlank->values == filled(0.0) && noBlank->percent == filled(0.0),
                    "no blank -> zeros");
    }
}

static void testAbsTx() {
    CalibrationEngine engine(fastSettings());
    engine.setBlank(well("A1"), BlankRecord{filled(800.0), "2025-01-01T00:00:00"});

    auto identical = engine.reduce(filled(800.0), Mode::AbsTx, well("A1"));
    ASSERT_TRUE(identical.has_value(), "sample == blank");
    for (std::size_t i = 0; i < identical->values.size(); ++i) {
        ASSERT_EQ(identical->values[i], 0.0, "A is zero");
        ASSERT_EQ(identical->percent[i], 100.0, "%T is 100");
    }

    engine.setDark(filled(10.0));
    engine.setBlank(well("A1"), BlankRecord{filled(110.0), "2025-01-01T00:00:01"});
    auto half = engine.reduce(filled(60.0), Mode::AbsTx, well("A1"));
    ASSERT_TRUE(half.has_value(), "dark-subtracted");
    ASSERT_NEAR(half->values[0], std::log10(2.0), 1e-12, "A = log10(I0/I)");
    ASSERT_NEAR(half->percent[0], 50.0, 1e-9, "%T = 100 * 10^-A");

    auto transmitted = engine.reduce(filled(60.0), Mode::Transmittance, well("A1"));
    ASSERT_TRUE(transmitted.has_value(), "transmittance");
    ASSERT_NEAR(transmitted->values[0], 0.5, 1e-12, "T = I/I0");
    ASSERT_NEAR(transmitted->percent[0], 50.0, 1e-9, "%T");

    // Sample below dark floors I at eps = 1 count: A = log10(100 / 1).
    auto floored = engine.reduce(filled(5.0), Mode::AbsTx, well("A1"));
    ASSERT_NEAR(floored->values[0], 2.0, 1e-12, "I floored at eps");
    ASSERT_NEAR(floored->percent[0], 1.0, 1e-9, "%T of floored sample");

    auto runaway = engine.reduce(filled(1e12), Mode::AbsTx, well("A1"));
    ASSERT_EQ(runaway->percent[0], 1e6, "%T clipped at the ceiling");

    auto otherWell = engine.reduce(filled(60.0), Mode::AbsTx, well("B1"));
    ASSERT_TRUE(otherWell && otherWell->values == filled(0.0), "blanks are per well");
}

static void testReflectance() {
    CalibrationEngine engine(fastSettings());
    engine.setDark(filled(10.0));
    engine.setWhite(filled(1010.0));

    auto reflectance = engine.reduce(filled(510.0), Mode::Reflectance);
    ASSERT_TRUE(reflectance.has_value(), "reflectance");
    ASSERT_NEAR(reflectance->values[3], 0.5, 1e-12, "R = (S-D)/(W-D)");
    ASSERT_NEAR(reflectance->percent[3], 50.0, 1e-9, "%R");

    auto absorbance = engine.reduce(filled(510.0), Mode::Absorbance);
    ASSERT_NEAR(absorbance->values[3], -std::log10(0.5), 1e-12, "A* = -log10(R)");
    ASSERT_NEAR(absorbance->percent[3], 50.0, 1e-9, "A* reports %R");

    engine.setMode(Mode::Reflectance);
    auto active = engine.reduce(filled(1010.0));
    ASSERT_TRUE(active && active->mode == Mode::Reflectance, "active mode used");
    ASSERT_NEAR(active->percent[0], 100.0, 1e-9, "white reads 100%");
}

static void testLengthMismatch() {
    CalibrationEngine engine(fastSettings());
    engine.setDark(filled(1.0));
    engine.setWhite(filled(100.0));
    auto narrow = engine.reduce(filled(50.0, 12), Mode::Reflectance);
    ASSERT_TRUE(!narrow && narrow.error() == Errc::ChannelLengthMismatch, "dark width differs");

    CalibrationEngine noDark(fastSettings());
    noDark.setBlank(well("A1"), BlankRecord{filled(100.0, 4), ""});
    auto blankWidth = noDark.reduce(filled(50.0), Mode::AbsTx, well("A1"));
    ASSERT_TRUE(!blankWidth && blankWidth.error() == Errc::ChannelLengthMismatch, "blank width differs");
}

static void testCaptureWithDummySensor() {
    sensor::dummy::DummySensor device;
    CalibrationEngine engine(fastSettings());

    ASSERT_TRUE(device.setIllumination(true).has_value(), "LED on");
    ASSERT_TRUE(engine.captureDark(device).has_value(), "dark capture");
    ASSERT_TRUE(!device.isIlluminated(), "dark capture switches the LED off");
    // 2 flush frames + 3 averaged frames.
    ASSERT_EQ(device.triggerCount(), std::size_t{5}, "dark flushes before averaging");
    auto snapshot = engine.snapshot();
    ASSERT_TRUE(snapshot.dark && *snapshot.dark == filled(50.0), "dark is the sensor floor");

    ASSERT_TRUE(engine.captureWhite(device).has_value(), "white capture");
    ASSERT_TRUE(device.isIlluminated(), "white capture switches the LED on");

    auto blank = engine.captureBlank(well("B2"), device);
    ASSERT_TRUE(blank.has_value(), "blank capture");
    ASSERT_TRUE(!blank->timestamp.empty(), "blank is timestamped");
    ASSERT_EQ(blank->values[0], 1050.0, "blank = dark + lit");

    device.setSampleFactor(0.5);
    auto frame = sensor::readFrame(device);
    ASSERT_TRUE(frame.has_value(), "sample frame");
    auto derived = engine.reduce(*frame, Mode::AbsTx, well("B2"));
    ASSERT_TRUE(derived.has_value(), "reduce sample");
    for (std::size_t i = 0; i < derived->values.size(); ++i) {
        ASSERT_NEAR(derived->values[i], std::log10(2.0), 1e-9, "half the light -> A = log10 2");
    }

    device.failNextTriggers(1);
    auto failed = engine.captureBlank(well("C3"), device);
    ASSERT_TRUE(!failed && failed.error() == Errc::SensorFailure, "sensor failure surfaces");
    ASSERT_TRUE(engine.snapshot().blankFor(well("C3")) == nullptr, "failed capture stores nothing");
}

static void testStatusAndSnapshots() {
    CalibrationEngine engine(fastSettings());
    engine.setBlank(well("A1"), BlankRecord{filled(1.0), "t"});
    engine.setBlank(well("B2"), BlankRecord{filled(2.0), "t"});
    engine.setBlank(well("H12"), BlankRecord{filled(3.0), "t"});

    auto status = engine.status(WellGrid{2, 2});
    ASSERT_EQ(status.wellsWithBlank.size(), std::size_t{2}, "blanks on this plate");
    ASSERT_EQ(status.wellsMissingBlank.size(), std::size_t{2}, "wells still missing");
    ASSERT_EQ(status.wellsMissingBlank[0].toString(), std::string("A2"), "plate order");
    ASSERT_TRUE(!status.darkSet && !status.whiteSet, "no dark or white");

    engine.setDark(filled(5.0));
    const auto before = engine.snapshot();
    engine.setDark(filled(7.0));
    engine.clearBlank(well("A1"));
    ASSERT_TRUE(*before.dark == filled(5.0), "old snapshot keeps its dark");
    ASSERT_TRUE(before.blankFor(well("A1")) != nullptr, "old snapshot keeps its blank");
    ASSERT_TRUE(engine.snapshot().blankFor(well("A1")) == nullptr, "blank cleared");

    engine.clearAll();
    const auto cleared = engine.snapshot();
    ASSERT_TRUE(!cleared.dark && !cleared.white && cleared.blanks.empty(), "clearAll");
}

static void testLiveReadoutAcrossModeChanges() {
    CalibrationEngine engine(fastSettings());
    engine.setWhite(filled(1000.0));
    LiveReadout readout(engine);

    engine.setMode(Mode::Absorbance);
    auto absorbance = readout.update(filled(500.0));
    ASSERT_TRUE(absorbance.has_value(), "absorbance reduction");
    ASSERT_NEAR(absorbance->values[0], std::log10(2.0), 1e-9, "A of half the white level");

    // Smoothed state stays in counts, so RAW shows counts only.
    engine.setMode(Mode::Raw);
    auto raw = readout.update(filled(500.0));
    ASSERT_TRUE(raw.has_value(), "raw passthrough");
    ASSERT_NEAR(raw->values[0], 500.0, 1e-9, "no absorbance mixed into counts");
    ASSERT_TRUE(raw->mode == Mode::Raw, "active mode used");

    engine.setMode(Mode::Reflectance);
    auto reflectance = readout.update(filled(1000.0));
    ASSERT_TRUE(reflectance.has_value(), "reflectance reduction");
    ASSERT_NEAR(reflectance->values[0], 0.65, 1e-9, "EMA of counts (500 -> 650) then R");

    readout.reset();
    auto reseeded = readout.update(filled(1000.0));
    ASSERT_TRUE(reseeded && std::fabs(reseeded->values[0] - 1.0) < 1e-9, "reset reseeds from the next frame");
}

int main() {
    testModeCycle();
    testMissingReferencesGiveZeros();
    testAbsTx();
    testReflectance();
    testLengthMismatch();
    testCaptureWithDummySensor();
    testStatusAndSnapshots();
    testLiveReadoutAcrossModeChanges();
    return finishTests("Calibration");
}
