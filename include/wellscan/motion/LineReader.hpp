#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <string_view>

namespace wellscan::motion {

/**
 * @brief Decode one raw line: UTF-8 when valid, otherwise Latin-1.
 *
 * Controllers occasionally emit stray high bytes (line noise, firmware
 * banners). Every byte maps to some code point under Latin-1, so decoding
 * never fails; the result is always UTF-8.
 */
std::string decodeLine(std::string_view raw);

bool isValidUtf8(std::string_view bytes);

/**
 * @brief Reassembles newline-terminated lines from arbitrary fragments.
 *
 * Lines are stripped of surrounding whitespace (including '\r'); blank lines
 * are dropped. A trailing partial line stays buffered until its newline
 * arrives. A partial line that reaches kMaxLineBytes is dropped, and the rest
 * of it is skipped up to the next newline.
 */
class LineReader {
public:
    static constexpr std::size_t kMaxLineBytes = 1024;

    void feed(std::string_view bytes);

    std::optional<std::string> nextLine();

    bool hasLine() const { return !lines.empty(); }
    std::size_t discardLines();

    void reset();

    const std::string& partial() const { return pending; }

    /// Over-long lines thrown away since construction.
    std::size_t droppedLines() const { return dropped; }

private:
    std::string pending;
    bool skipping = false;
    std::size_t dropped = 0;
    std::deque<std::string> lines;
};

} // namespace wellscan::motion
