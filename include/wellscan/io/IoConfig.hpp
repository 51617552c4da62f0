#pragma once

#include <asio.hpp>
#include <system_error>

namespace wellscan::io {

/**
 * @brief Centralises Asio aliases so higher-level code never includes Asio directly.
 *
 * Exposes:
 * - `wellscan::io::asio` as the standalone Asio namespace.
 * - `wellscan::io::serial_port` for the motion controller link.
 */
namespace asio = ::asio;

using serial_port = asio::serial_port;
using error_code = std::error_code;

} // namespace wellscan::io
