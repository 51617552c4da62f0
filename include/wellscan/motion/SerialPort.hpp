#pragma once

#include "wellscan/io/IoConfig.hpp"
#include "wellscan/io/IoService.hpp"
#include "wellscan/io/TimeoutConfig.hpp"
#include "wellscan/motion/ByteStream.hpp"
#include "wellscan/motion/MotionConfig.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace wellscan::motion {

using duration = io::TimeoutConfig::duration;

/**
 * @brief `asio::serial_port` ByteStream with deadlines.
 *
 * Highlights:
 * - open() configures 8N1 at the requested baud rate, no flow control.
 * - write() and readSome() block the caller while enforcing a deadline via
 *   io::with_deadline.
 * - Work is serialized by a strand on the shared io_context.
 *
 * Bytes delivered by a read that completes after its deadline has already
 * fired are kept in an internal buffer and handed out by the next readSome(),
 * so a timeout never loses data mid-line.
 */
class SerialPort : public ByteStream {
public:
    SerialPort();
    ~SerialPort() override;

    SerialPort(const SerialPort&) = delete;
    SerialPort& operator=(const SerialPort&) = delete;

    std::error_code open(const std::string& device,
                         unsigned int baudRate = config::MOTION_BAUD_RATE);

    /// A non-positive @p timeout falls back to defaultTimeout().
    expected<void> write(std::string_view bytes, std::chrono::milliseconds timeout) override;
    expected<std::string> readSome(std::chrono::milliseconds timeout) override;

    void close() override;
    bool isOpen() const override { return port_.is_open(); }

    const std::string& device() const { return device_; }

    void setDefaultTimeout(duration timeout) { defaultTimeout_ = io::TimeoutConfig::sanitize(timeout); }
    duration defaultTimeout() const { return defaultTimeout_; }

private:
    std::chrono::milliseconds effectiveTimeout(std::chrono::milliseconds timeout) const;

    struct ReadState {
        std::mutex m;
        std::string received;
    };

    std::shared_ptr<asio::io_context> io_;
    asio::strand<asio::io_context::executor_type> strand_;
    io::serial_port port_;
    std::shared_ptr<ReadState> readState_;
    duration defaultTimeout_;
    std::string device_;
};

using StreamFactory =
    std::function<expected<std::unique_ptr<ByteStream>>(const std::string& device)>;

/// Factory opening real serial ports at MOTION_BAUD_RATE.
StreamFactory serialPortFactory();

} // namespace wellscan::motion
