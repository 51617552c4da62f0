#include "wellscan/motion/SerialPort.hpp"

#include "wellscan/io/Deadline.hpp"
#include "wellscan/log/Log.hpp"

#include <array>
#include <utility>

namespace wellscan::motion {

namespace asio = io::asio;

SerialPort::SerialPort()
: io_(io::shared_io_context())
, strand_(asio::make_strand(*io_))
, port_(strand_)
, readState_(std::make_shared<ReadState>())
, defaultTimeout_(io::TimeoutConfig::defaultTimeout())
{}

SerialPort::~SerialPort() {
    close();
}

std::error_code SerialPort::open(const std::string& device, unsigned int baudRate) {
    close();

    std::error_code ec;
    port_.open(device, ec);
    if (ec) {
        return ec;
    }

    using base = asio::serial_port_base;
    port_.set_option(base::baud_rate(baudRate), ec);
    if (!ec) port_.set_option(base::character_size(8), ec);
    if (!ec) port_.set_option(base::parity(base::parity::none), ec);
    if (!ec) port_.set_option(base::stop_bits(base::stop_bits::one), ec);
    if (!ec) port_.set_option(base::flow_control(base::flow_control::none), ec);
    if (ec) {
        std::error_code ignored;
        port_.close(ignored);
        return ec;
    }

    {
        std::lock_guard<std::mutex> lock(readState_->m);
        readState_->received.clear();
    }
    device_ = device;
    logInfo("[SerialPort] opened ", device, " at ", baudRate, " baud\n");
    return {};
}

expected<void> SerialPort::write(std::string_view bytes, std::chrono::milliseconds timeout) {
    if (!port_.is_open()) {
        return unexpected(std::make_error_code(std::errc::not_connected));
    }
    // The buffer must outlive this call if the deadline fires first.
    auto data = std::make_shared<std::string>(bytes);
    auto ex = port_.get_executor();
    auto ec = io::with_deadline(ex, effectiveTimeout(timeout),
        [&](auto completion){
            asio::async_write(port_, asio::buffer(*data),
                [data, completion](const std::error_code& op_ec, std::size_t){
                    completion(op_ec);
                });
        },
        [&]{ std::error_code ignored; port_.cancel(ignored); }
    );
    if (ec) {
        return unexpected(ec);
    }
    return {};
}

expected<std::string> SerialPort::readSome(std::chrono::milliseconds timeout) {
    if (!port_.is_open()) {
        return unexpected(std::make_error_code(std::errc::not_connected));
    }

    auto state = readState_;
    {
        std::lock_guard<std::mutex> lock(state->m);
        if (!state->received.empty()) {
            return std::exchange(state->received, std::string{});
        }
    }

    // One buffer per operation: a cancelled read may still complete late.
    auto chunk = std::make_shared<std::array<char, 256>>();
    auto ex = port_.get_executor();
    auto ec = io::with_deadline(ex, effectiveTimeout(timeout),
        [&](auto completion){
            port_.async_read_some(asio::buffer(*chunk),
                [state, chunk, completion](const std::error_code& op_ec, std::size_t transferred){
                    {
                        std::lock_guard<std::mutex> lock(state->m);
                        state->received.append(chunk->data(), transferred);
                    }
                    completion(op_ec);
                });
        },
        [&]{ std::error_code ignored; port_.cancel(ignored); }
    );

    if (ec && ec != asio::error::timed_out && ec != asio::error::operation_aborted) {
        logError("[SerialPort] read failed on ", device_, ": ", ec.message(), "\n");
        return unexpected(ec);
    }

    std::lock_guard<std::mutex> lock(state->m);
    return std::exchange(state->received, std::string{});
}

std::chrono::milliseconds SerialPort::effectiveTimeout(std::chrono::milliseconds timeout) const {
    return timeout.count() > 0 ? timeout : defaultTimeout_;
}

void SerialPort::close() {
    if (!port_.is_open()) return;
    logInfo("[SerialPort] close() ", device_, "\n");
    std::error_code ec;
    port_.cancel(ec);
    port_.close(ec);
}

StreamFactory serialPortFactory() {
    return [](const std::string& device) -> expected<std::unique_ptr<ByteStream>> {
        auto port = std::make_unique<SerialPort>();
        if (auto ec = port->open(device); ec) {
            return unexpected(ec);
        }
        return std::unique_ptr<ByteStream>(std::move(port));
    };
}

} // namespace wellscan::motion
