/**
 * @brief G-code exchange with the motion controller: connect, send/ack,
 *        settled moves, homing and position queries.
 */
#include "wellscan/motion/MotionSession.hpp"

#include "wellscan/core/Error.hpp"
#include "wellscan/log/Log.hpp"
#include "wellscan/motion/MotionResponse.hpp"
#include "wellscan/motion/PortDiscovery.hpp"

#include <algorithm>
#include <thread>

namespace wellscan::motion {

using namespace std::chrono;

const char* toString(LinkState state) {
    switch (state) {
        case LinkState::Disconnected: return "Disconnected";
        case LinkState::Connecting:   return "Connecting";
        case LinkState::Connected:    return "Connected";
        case LinkState::Homed:        return "Homed";
    }
    return "Unknown";
}

MotionSession::MotionSession(StreamFactory factory, MotionTimeouts timeouts)
: openStream(std::move(factory))
, limits(timeouts) {}

MotionSession::~MotionSession() {
    disconnect();
}

expected<std::string> MotionSession::connect(const std::vector<std::string>& candidates) {
    std::lock_guard<std::mutex> lock(exchangeMutex);
    closeLocked();
    linkState = LinkState::Connecting;

    std::optional<std::string> chosen;
    for (const auto& candidate : candidates) {
        auto trial = openStream(candidate);
        if (!trial) {
            logError("[MotionSession] failed to open ", candidate, ": ",
                     trial.error().message(), "\n");
            continue;
        }
        (*trial)->close();
        chosen = candidate;
        logInfo("[MotionSession] selected port ", candidate, "\n");
        break;
    }

    if (!chosen) {
        linkState = LinkState::Disconnected;
        logError("[MotionSession] no available ports responded (", candidates.size(),
                 " candidate(s))\n");
        return unexpected(make_error_code(Errc::NoPortFound));
    }

    const int attempts = std::max(1, limits.openAttempts);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        auto opened = openStream(*chosen);
        if (opened) {
            stream = std::move(*opened);
            reader.reset();
            resyncPending = false;
            port = *chosen;
            linkState = LinkState::Connected;
            rememberPosition(std::nullopt);
            logInfo("[MotionSession] connected to ", port, " at ",
                    config::MOTION_BAUD_RATE, " baud\n");
            return port;
        }
        logError("[MotionSession] waiting for connection on ", *chosen, " (attempt ",
                 attempt, "/", attempts, "): ", opened.error().message(), "\n");
        if (attempt < attempts) {
            std::this_thread::sleep_for(limits.openBackoff);
        }
    }

    linkState = LinkState::Disconnected;
    logError("[MotionSession] failed to connect after ", attempts, " attempts\n");
    return unexpected(make_error_code(Errc::ConnectionFailed));
}

expected<std::string> MotionSession::connect() {
    return connect(listCandidatePorts());
}

void MotionSession::disconnect() {
    std::lock_guard<std::mutex> lock(exchangeMutex);
    closeLocked();
}

void MotionSession::closeLocked() {
    if (stream) {
        logInfo("[MotionSession] close() ", port, "\n");
        stream->close();
        stream.reset();
    }
    reader.reset();
    linkState = LinkState::Disconnected;
}

bool MotionSession::isConnected() const {
    const auto current = linkState.load();
    return current == LinkState::Connected || current == LinkState::Homed;
}

std::string MotionSession::portName() const {
    std::lock_guard<std::mutex> lock(exchangeMutex);
    return port;
}

expected<Ack> MotionSession::send(std::string_view command) {
    return send(command, limits.ack);
}

expected<Ack> MotionSession::send(std::string_view command, milliseconds timeout) {
    std::lock_guard<std::mutex> lock(exchangeMutex);
    return exchange(command, timeout);
}

void MotionSession::drainLocked(std::string_view command) {
    // After a timeout the controller may still owe an "ok"; wait for the line
    // to stay quiet for a full poll slice. Otherwise take only what is queued.
    const auto quiet = resyncPending ? std::max(limits.pollSlice, milliseconds{1}) : milliseconds{1};
    const auto deadline = steady_clock::now() + std::max(limits.ack, quiet);
    while (steady_clock::now() < deadline) {
        auto chunk = stream->readSome(quiet);
        if (!chunk || chunk->empty()) {
            break;
        }
        reader.feed(*chunk);
    }

    const auto stale = reader.discardLines();
    const bool fragment = !reader.partial().empty();
    reader.reset();
    if (stale > 0 || fragment) {
        logInfo("[MotionSession] discarded ", stale, " unsolicited line(s)",
                fragment ? " and a partial line" : "", " before '", command, "'\n");
    }
    resyncPending = false;
}

expected<void> MotionSession::writeLine(std::string_view command, milliseconds timeout) {
    if (!stream || !stream->isOpen()) {
        logError("[MotionSession] '", command, "' issued without an open link\n");
        return unexpected(make_error_code(Errc::NotConnected));
    }

    drainLocked(command);

    const std::string line = std::string(command) + '\n';
    if (auto written = stream->write(line, timeout); !written) {
        const auto& ec = written.error();
        logError("[MotionSession] TX error on ", port, " for '", command, "': ",
                 ec.message(), "\n");
        if (ec == std::errc::timed_out) {
            return unexpected(make_error_code(Errc::ProtocolTimeout));
        }
        return unexpected(make_error_code(Errc::ConnectionFailed));
    }
    return {};
}

expected<bool> MotionSession::pump(steady_clock::time_point deadline) {
    const auto now = steady_clock::now();
    if (now >= deadline) {
        return false;
    }
    auto slice = duration_cast<milliseconds>(deadline - now);
    slice = std::clamp(slice, milliseconds{1}, std::max(limits.pollSlice, milliseconds{1}));

    auto chunk = stream->readSome(slice);
    if (!chunk) {
        logError("[MotionSession] RX error on ", port, ": ", chunk.error().message(), "\n");
        return unexpected(make_error_code(Errc::ConnectionFailed));
    }
    reader.feed(*chunk);
    return !chunk->empty();
}

expected<Ack> MotionSession::exchange(std::string_view command, milliseconds timeout) {
    if (auto written = writeLine(command, timeout); !written) {
        return unexpected(written.error());
    }

    Ack ack;
    const auto deadline = steady_clock::now() + timeout;
    while (true) {
        while (auto line = reader.nextLine()) {
            switch (classifyAck(*line)) {
                case AckKind::Ok:
                    ack.line = std::move(*line);
                    return ack;
                case AckKind::Error:
                    logError("[MotionSession] error from controller for '", command, "': ",
                             *line, "\n");
                    return unexpected(make_error_code(Errc::ProtocolError));
                case AckKind::None:
                    ack.messages.push_back(std::move(*line));
                    break;
            }
        }

        if (steady_clock::now() >= deadline) {
            logError("[MotionSession] no acknowledgment for '", command, "' within ",
                     timeout.count(), "ms\n");
            resyncPending = true;
            return unexpected(make_error_code(Errc::ProtocolTimeout));
        }

        if (auto pumped = pump(deadline); !pumped) {
            return unexpected(pumped.error());
        }
    }
}

expected<void> MotionSession::moveLocked(const Point3& target, int feedrate) {
    logInfo("[MotionSession] moving to: ", geometry::formatPoint(target), "\n");

    // G1 is acknowledged once queued; M400 only once the queue has drained.
    auto queued = exchange(GcodeCommand::linearMove(target, feedrate).text(), limits.ack);
    if (!queued) {
        rememberPosition(std::nullopt);
        return unexpected(queued.error());
    }
    auto settled = exchange(GcodeCommand::waitForMoves().text(), limits.settle);
    if (!settled) {
        rememberPosition(std::nullopt);
        return unexpected(settled.error());
    }
    rememberPosition(target);
    return {};
}

expected<void> MotionSession::moveTo(const Point3& target, int feedrate) {
    std::lock_guard<std::mutex> lock(exchangeMutex);
    return moveLocked(target, feedrate);
}

expected<void> MotionSession::moveTo(double x, double y, double z, int feedrate) {
    return moveTo(Point3{x, y, z}, feedrate);
}

expected<void> MotionSession::home() {
    std::lock_guard<std::mutex> lock(exchangeMutex);
    logInfo("[MotionSession] homing all axes\n");
    auto homed = exchange(GcodeCommand::homeAll().text(), limits.settle);
    if (!homed) {
        rememberPosition(std::nullopt);
        return unexpected(homed.error());
    }
    linkState = LinkState::Homed;
    rememberPosition(Point3{});
    return {};
}

std::optional<Point3> MotionSession::queryPosition() {
    std::lock_guard<std::mutex> lock(exchangeMutex);
    return queryPositionLocked();
}

std::optional<Point3> MotionSession::queryPositionLocked() {
    const auto command = GcodeCommand::reportPosition();
    if (!writeLine(command.text(), limits.position)) {
        return std::nullopt;
    }

    std::optional<Point3> found;
    const auto deadline = steady_clock::now() + limits.position;
    bool finished = false;
    while (!finished) {
        while (auto line = reader.nextLine()) {
            if (!found) {
                found = parsePosition(*line);
            }
            const auto kind = classifyAck(*line);
            if (kind == AckKind::Error) {
                logError("[MotionSession] error from controller for 'M114': ", *line, "\n");
                finished = true;
                break;
            }
            // The report precedes its "ok"; stop once both have been seen.
            if (kind == AckKind::Ok && found) {
                finished = true;
                break;
            }
        }
        if (finished || steady_clock::now() >= deadline) {
            break;
        }
        if (auto pumped = pump(deadline); !pumped) {
            break;
        }
    }
    if (!finished) {
        resyncPending = true;
    }

    if (found) {
        rememberPosition(found);
    } else {
        logInfo("[MotionSession] position unknown (no M114 report within ",
                limits.position.count(), "ms)\n");
    }
    return found;
}

expected<void> MotionSession::jog(Axis axis, double delta, int feedrate) {
    std::lock_guard<std::mutex> lock(exchangeMutex);
    if (!stream || !stream->isOpen()) {
        logError("[MotionSession] jog issued without an open link\n");
        return unexpected(make_error_code(Errc::NotConnected));
    }

    auto base = lastKnownPosition();
    if (!base) {
        base = queryPositionLocked();
    }
    if (!base) {
        logError("[MotionSession] cannot jog ", static_cast<char>(axis),
                 ": current position unknown\n");
        return unexpected(make_error_code(Errc::ProtocolTimeout));
    }

    Point3 target = *base;
    switch (axis) {
        case Axis::X: target.x += delta; break;
        case Axis::Y: target.y += delta; break;
        case Axis::Z: target.z += delta; break;
    }
    target.x = geometry::roundTo(target.x, geometry::kPositionDecimals);
    target.y = geometry::roundTo(target.y, geometry::kPositionDecimals);
    target.z = geometry::roundTo(target.z, geometry::kPositionDecimals);
    return moveLocked(target, feedrate);
}

std::optional<Point3> MotionSession::lastKnownPosition() const {
    std::lock_guard<std::mutex> lock(positionMutex);
    return lastPosition;
}

void MotionSession::rememberPosition(std::optional<Point3> position) {
    std::lock_guard<std::mutex> lock(positionMutex);
    lastPosition = position;
}

} // namespace wellscan::motion
