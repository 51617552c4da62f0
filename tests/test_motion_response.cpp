#include "TestSupport.hpp"

#include "wellscan/motion/GcodeCommand.hpp"
#include "wellscan/motion/LineReader.hpp"
#include "wellscan/motion/MotionResponse.hpp"
#include "wellscan/motion/PortDiscovery.hpp"

using namespace wellscan;
using namespace wellscan::motion;

static void testClassifyAck() {
    ASSERT_TRUE(classifyAck("ok") == AckKind::Ok, "bare ok");
    ASSERT_TRUE(classifyAck("OK T:210.0 /210.0") == AckKind::Ok, "upper-case ok with temperatures");
    ASSERT_TRUE(classifyAck("Error:Unknown command: \"G99\"") == AckKind::Error, "Marlin error");
    ASSERT_TRUE(classifyAck("ERROR") == AckKind::Error, "upper-case error");
    ASSERT_TRUE(classifyAck("echo:busy: processing") == AckKind::None, "busy echo");
    ASSERT_TRUE(classifyAck("X:1.00 Y:2.00 Z:3.00 E:0.00 Count X:0 Y:0 Z:0") == AckKind::None,
                "position report is informational");
}

static void testParsePosition() {
    auto p = parsePosition("X:10.00 Y:20.50 Z:5.25 E:0.00 Count X:800 Y:1640 Z:2100");
    ASSERT_TRUE(p.has_value(), "full M114 report");
    ASSERT_TRUE(*p == (geometry::Point3{10.0, 20.5, 5.25}), "millimetre values before Count");

    auto negative = parsePosition("X:-1.5 Y:0 Z:12");
    ASSERT_TRUE(negative && *negative == (geometry::Point3{-1.5, 0.0, 12.0}), "signed and integer values");

    // Stepper counts after "Count" must not stand in for missing millimetre axes.
    ASSERT_TRUE(!parsePosition("X:1.00 Y:2.00 Count X:80 Y:160 Z:240"), "Z only in Count section");
    ASSERT_TRUE(!parsePosition("ok"), "no axes");
    ASSERT_TRUE(!parsePosition("X:abc Y:1 Z:2"), "non-numeric axis");
}

static void testGcodeFormatting() {
    ASSERT_EQ(GcodeCommand::linearMove({10.0, 20.5, 3.456}, 3000).text(),
              std::string("G1 X10.00 Y20.50 Z3.46 F3000"), "G1 with two decimals");
    ASSERT_EQ(GcodeCommand::linearMove({0.0, 0.0, 0.0}, 1200).line(),
              std::string("G1 X0.00 Y0.00 Z0.00 F1200\n"), "wire form ends with newline");
    ASSERT_EQ(GcodeCommand::waitForMoves().text(), std::string("M400"), "M400");
    ASSERT_EQ(GcodeCommand::homeAll().text(), std::string("G28"), "G28");
    ASSERT_EQ(GcodeCommand::reportPosition().text(), std::string("M114"), "M114");
}

static void testLineReassembly() {
    LineReader reader;
    reader.feed("o");
    ASSERT_TRUE(!reader.nextLine(), "no line without newline");
    reader.feed("k\r\nX:1.00 Y:2");
    auto first = reader.nextLine();
    ASSERT_TRUE(first && *first == "ok", "fragments joined, CR stripped");
    ASSERT_EQ(reader.partial(), std::string("X:1.00 Y:2"), "partial line kept");
    reader.feed(".00 Z:3.00\n\n   \nok\n");
    auto second = reader.nextLine();
    ASSERT_TRUE(second && *second == "X:1.00 Y:2.00 Z:3.00", "second line completed");
    auto third = reader.nextLine();
    ASSERT_TRUE(third && *third == "ok", "blank lines skipped");
    ASSERT_TRUE(!reader.nextLine(), "drained");

    reader.feed("stale\n");
    ASSERT_EQ(reader.discardLines(), std::size_t{1}, "discard complete lines");
}

static void testOverlongLineDropped() {
    LineReader reader;
    reader.feed(std::string(LineReader::kMaxLineBytes + 500, 'x'));
    ASSERT_TRUE(reader.partial().size() <= LineReader::kMaxLineBytes, "fragment stays bounded");
    ASSERT_EQ(reader.droppedLines(), std::size_t{1}, "overflow counted");
    reader.feed("tail\nok\n");
    auto line = reader.nextLine();
    ASSERT_TRUE(line && *line == "ok", "rest of the long line skipped");
    ASSERT_TRUE(!reader.nextLine(), "nothing else");

    reader.feed(std::string(LineReader::kMaxLineBytes + 1, 'y'));
    reader.reset();
    reader.feed("ok\n");
    auto afterReset = reader.nextLine();
    ASSERT_TRUE(afterReset && *afterReset == "ok", "reset ends skipping");
}

static void testLatin1Fallback() {
    ASSERT_TRUE(isValidUtf8("plain ascii"), "ascii");
    ASSERT_TRUE(isValidUtf8("\xC2\xB0" "C"), "valid two-byte sequence");
    ASSERT_TRUE(!isValidUtf8("\xB0" "C"), "lone continuation byte");
    ASSERT_TRUE(!isValidUtf8("\xE2\x82"), "truncated sequence");
    ASSERT_TRUE(!isValidUtf8("\xC0\xAF"), "overlong encoding");

    ASSERT_EQ(decodeLine("T:21\xB0" "C"), std::string("T:21\xC2\xB0" "C"), "Latin-1 degree sign");
    ASSERT_EQ(decodeLine("caf\xC3\xA9"), std::string("caf\xC3\xA9"), "valid UTF-8 untouched");

    LineReader reader;
    reader.feed("\xFF\xFEok\n");
    auto line = reader.nextLine();
    ASSERT_TRUE(line && *line == "\xC3\xBF\xC3\xBEok", "noisy line still decodes");
    ASSERT_TRUE(line && classifyAck(*line) == AckKind::Ok, "noisy ack still acknowledges");
}

static void testPortNames() {
    ASSERT_TRUE(isCandidatePortName("ttyUSB0"), "USB serial");
    ASSERT_TRUE(isCandidatePortName("ttyACM1"), "CDC ACM");
    ASSERT_TRUE(!isCandidatePortName("ttyAMA0"), "on-board UART excluded");
    ASSERT_TRUE(!isCandidatePortName("ttyS0"), "console excluded");
    ASSERT_TRUE(!isCandidatePortName("tty1"), "virtual terminal");
    ASSERT_TRUE(listCandidatePorts("/nonexistent-wellscan-dir").empty(), "missing directory");
}

int main() {
    testClassifyAck();
    testParsePosition();
    testGcodeFormatting();
    testLineReassembly();
    testOverlongLineDropped();
    testLatin1Fallback();
    testPortNames();
    return finishTests("MotionResponse");
}
