#include "wellscan/log/Log.hpp"

#include <iostream>
#include <mutex>

namespace wellscan::log {

namespace {

LogHandler makeDefaultInfoSink() {
    return [](std::string_view message) {
        std::cout << message;
        std::cout.flush();
    };
}

LogHandler makeDefaultErrorSink() {
    return [](std::string_view message) {
        std::cerr << message;
        std::cerr.flush();
    };
}

std::mutex sinkMutex;
LogHandler infoHandler = makeDefaultInfoSink();
LogHandler errorHandler = makeDefaultErrorSink();

LogHandler handlerFor(LogLevel level) {
    std::lock_guard lock(sinkMutex);
    return level == LogLevel::Info ? infoHandler : errorHandler;
}

} // namespace

void setLogHandler(LogLevel level, LogHandler handler) {
    std::lock_guard lock(sinkMutex);
    if (level == LogLevel::Info) {
        infoHandler = handler ? std::move(handler) : makeDefaultInfoSink();
    } else {
        errorHandler = handler ? std::move(handler) : makeDefaultErrorSink();
    }
}

void setLogHandlers(LogHandler newInfo, LogHandler newError) {
    std::lock_guard lock(sinkMutex);
    infoHandler = newInfo ? std::move(newInfo) : makeDefaultInfoSink();
    errorHandler = newError ? std::move(newError) : makeDefaultErrorSink();
}

void resetLogHandlers() {
    std::lock_guard lock(sinkMutex);
    infoHandler = makeDefaultInfoSink();
    errorHandler = makeDefaultErrorSink();
}

void logInfo(std::string_view message) {
    // Copy the handler out so a slow sink never blocks handler replacement.
    if (auto handler = handlerFor(LogLevel::Info)) {
        handler(message);
    }
}

void logError(std::string_view message) {
    if (auto handler = handlerFor(LogLevel::Error)) {
        handler(message);
    }
}

// ScopedLogCapture -------------------------------------------------------------

struct ScopedLogCapture::Buffer {
    mutable std::mutex mutex;
    std::vector<std::string> info;
    std::vector<std::string> error;
};

ScopedLogCapture::ScopedLogCapture()
: buffer(std::make_shared<Buffer>()) {
    // Handlers hold their own reference; a sink copied by another thread may
    // still run after this object is gone.
    auto target = buffer;
    setLogHandlers(
        [target](std::string_view message) {
            std::lock_guard lock(target->mutex);
            target->info.emplace_back(message);
        },
        [target](std::string_view message) {
            std::lock_guard lock(target->mutex);
            target->error.emplace_back(message);
        });
}

ScopedLogCapture::~ScopedLogCapture() {
    resetLogHandlers();
}

std::vector<std::string> ScopedLogCapture::infoLines() const {
    std::lock_guard lock(buffer->mutex);
    return buffer->info;
}

std::vector<std::string> ScopedLogCapture::errorLines() const {
    std::lock_guard lock(buffer->mutex);
    return buffer->error;
}

bool ScopedLogCapture::errorContains(std::string_view needle) const {
    std::lock_guard lock(buffer->mutex);
    for (const auto& line : buffer->error) {
        if (line.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

} // namespace wellscan::log
