#pragma once
#include "wellscan/io/IoConfig.hpp"
#include <thread>
#include <memory>

namespace wellscan::io {

/**
 * @brief RAII wrapper around `asio::io_context` that runs a dedicated I/O thread.
 *
 * All serial port reads, writes and deadline timers complete on this thread;
 * callers block on the results through `with_deadline`, so the motion
 * protocol reads as straight-line code while Asio stays asynchronous.
 *
 * Lifetime notes:
 * - Destroy serial ports before the service so their handlers complete while
 *   the `io_context` is still running.
 * - The destructor releases the work guard, calls `stop()`, and joins.
 */
class IoService {
public:
    IoService();
    ~IoService();

    IoService(const IoService&) = delete;
    IoService& operator=(const IoService&) = delete;
    IoService(IoService&&) = delete;
    IoService& operator=(IoService&&) = delete;

    std::shared_ptr<asio::io_context> io() { return io_; }

private:
    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread t_;
};

/// io_context of the process-wide service, created on first use.
std::shared_ptr<asio::io_context> shared_io_context();

} // namespace wellscan::io
