#pragma once

#include "wellscan/core/Expected.hpp"
#include "wellscan/geometry/Geometry.hpp"
#include "wellscan/motion/ByteStream.hpp"
#include "wellscan/motion/GcodeCommand.hpp"
#include "wellscan/motion/LineReader.hpp"
#include "wellscan/motion/MotionConfig.hpp"
#include "wellscan/motion/SerialPort.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wellscan::motion {

using geometry::Point3;

enum class LinkState : std::uint8_t {
    Disconnected = 0,
    Connecting,
    Connected,
    Homed
};

const char* toString(LinkState state);

struct MotionTimeouts {
    std::chrono::milliseconds ack = config::MOTION_ACK_TIMEOUT;
    std::chrono::milliseconds settle = config::MOTION_SETTLE_TIMEOUT;
    std::chrono::milliseconds position = config::MOTION_POSITION_TIMEOUT;
    std::chrono::milliseconds pollSlice = config::MOTION_POLL_SLICE;
    int openAttempts = config::MOTION_OPEN_ATTEMPTS;
    std::chrono::milliseconds openBackoff = config::MOTION_OPEN_BACKOFF;
};

/// Acknowledgment of one command.
struct Ack {
    std::string line;                    ///< The line that contained "ok".
    std::vector<std::string> messages;   ///< Informational lines seen before it.
};

/**
 * @brief Owns the link to the motion controller and speaks its G-code
 *        request/acknowledge protocol.
 *
 * Responsibilities:
 * - Pick and open a port (test-open candidates, retry the real open).
 * - Write one command, then read lines until "ok" or "error" within a
 *   deadline. Lines may arrive split across reads and are reassembled;
 *   non-UTF-8 lines are decoded as Latin-1.
 * - Block until queued moves have physically finished (M400) and report the
 *   reported position (M114).
 *
 * Exchanges are serialised by an internal mutex: a command and its
 * acknowledgment are never interleaved with another caller's. A move plus its
 * M400 is one exchange. There is no retry at this layer.
 *
 * Before every write the link is drained: queued bytes, parsed lines and any
 * partial line are discarded, so a reply can only acknowledge the command
 * written after it. After an exchange that ended without its ack the drain
 * waits for one quiet poll slice to absorb the late reply.
 */
class MotionSession {
public:
    explicit MotionSession(StreamFactory factory = serialPortFactory(),
                           MotionTimeouts timeouts = {});
    ~MotionSession();

    MotionSession(const MotionSession&) = delete;
    MotionSession& operator=(const MotionSession&) = delete;

    /**
     * @brief Probe @p candidates in order and connect to the first that opens.
     *
     * The check is an open followed by an immediate close. The chosen port is
     * then opened for real with up to `openAttempts` tries, `openBackoff`
     * apart. Command exchange is validated lazily on the first send().
     *
     * @return The device path in use; Errc::NoPortFound when no candidate
     *         opens, Errc::ConnectionFailed when the chosen port fails every
     *         attempt.
     */
    expected<std::string> connect(const std::vector<std::string>& candidates);

    /// connect() over listCandidatePorts().
    expected<std::string> connect();

    void disconnect();                  // idempotent
    bool isConnected() const;
    LinkState state() const { return linkState.load(); }
    std::string portName() const;

    /// Send with the ack timeout.
    expected<Ack> send(std::string_view command);
    expected<Ack> send(std::string_view command, std::chrono::milliseconds timeout);

    /// G1 to @p target, then M400 so the call returns once motion has stopped.
    expected<void> moveTo(const Point3& target, int feedrate = config::MOTION_DEFAULT_FEEDRATE);
    expected<void> moveTo(double x, double y, double z, int feedrate = config::MOTION_DEFAULT_FEEDRATE);

    /// G28 with the settle timeout. The link becomes Homed.
    expected<void> home();

    /// M114 inside the position window; std::nullopt when no report was parsed.
    std::optional<Point3> queryPosition();

    /// Move one axis by @p delta from the last known position.
    expected<void> jog(Axis axis, double delta, int feedrate = config::MOTION_DEFAULT_FEEDRATE);

    std::optional<Point3> lastKnownPosition() const;

    const MotionTimeouts& timeouts() const { return limits; }
    void setTimeouts(const MotionTimeouts& timeouts) { limits = timeouts; }

private:
    expected<Ack> exchange(std::string_view command, std::chrono::milliseconds timeout);
    void drainLocked(std::string_view command);
    expected<void> writeLine(std::string_view command, std::chrono::milliseconds timeout);
    expected<bool> pump(std::chrono::steady_clock::time_point deadline);
    expected<void> moveLocked(const Point3& target, int feedrate);
    std::optional<Point3> queryPositionLocked();
    void closeLocked();
    void rememberPosition(std::optional<Point3> position);

    StreamFactory openStream;
    MotionTimeouts limits;

    mutable std::mutex exchangeMutex;
    std::unique_ptr<ByteStream> stream;
    LineReader reader;
    bool resyncPending = false;     // an exchange ended without its ack
    std::string port;
    std::atomic<LinkState> linkState{LinkState::Disconnected};

    mutable std::mutex positionMutex;
    std::optional<Point3> lastPosition;
};

} // namespace wellscan::motion
