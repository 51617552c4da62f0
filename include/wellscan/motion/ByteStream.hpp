#pragma once

#include "wellscan/core/Expected.hpp"

#include <chrono>
#include <string>
#include <string_view>

namespace wellscan::motion {

/**
 * @brief Bidirectional byte transport underneath the G-code protocol.
 *
 * The session never assumes message boundaries: readSome() returns whatever
 * bytes arrived, split anywhere. An empty string means nothing arrived
 * within @p timeout; errors are reserved for a broken transport.
 */
class ByteStream {
public:
    virtual ~ByteStream() = default;

    virtual expected<void> write(std::string_view bytes, std::chrono::milliseconds timeout) = 0;
    virtual expected<std::string> readSome(std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;               // idempotent
    virtual bool isOpen() const = 0;
};

} // namespace wellscan::motion
