#include "wellscan/motion/LineReader.hpp"

#include <cctype>
#include <cstdint>

namespace wellscan::motion {

namespace {

std::string_view trim(std::string_view text) {
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    return text;
}

} // namespace

bool isValidUtf8(std::string_view bytes) {
    std::size_t i = 0;
    while (i < bytes.size()) {
        const auto lead = static_cast<std::uint8_t>(bytes[i]);
        std::size_t extra = 0;
        std::uint32_t minimum = 0;
        std::uint32_t codePoint = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            extra = 1; minimum = 0x80; codePoint = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2; minimum = 0x800; codePoint = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3; minimum = 0x10000; codePoint = lead & 0x07;
        } else {
            return false;
        }
        if (i + extra >= bytes.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= extra; ++k) {
            const auto next = static_cast<std::uint8_t>(bytes[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            codePoint = (codePoint << 6) | (next & 0x3F);
        }
        // Overlong forms, UTF-16 surrogates and values past U+10FFFF.
        if (codePoint < minimum || codePoint > 0x10FFFF ||
            (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

std::string decodeLine(std::string_view raw) {
    if (isValidUtf8(raw)) {
        return std::string(raw);
    }
    std::string out;
    out.reserve(raw.size() * 2);
    for (char c : raw) {
        const auto byte = static_cast<std::uint8_t>(c);
        if (byte < 0x80) {
            out.push_back(c);
        } else {
            out.push_back(static_cast<char>(0xC0 | (byte >> 6)));
            out.push_back(static_cast<char>(0x80 | (byte & 0x3F)));
        }
    }
    return out;
}

void LineReader::feed(std::string_view bytes) {
    for (char c : bytes) {
        if (c != '\n') {
            if (skipping) {
                continue;
            }
            if (pending.size() >= kMaxLineBytes) {
                pending.clear();
                skipping = true;
                ++dropped;
                continue;
            }
            pending.push_back(c);
            continue;
        }
        if (skipping) {
            skipping = false;
            continue;
        }
        auto line = trim(pending);
        if (!line.empty()) {
            lines.push_back(decodeLine(line));
        }
        pending.clear();
    }
}

std::optional<std::string> LineReader::nextLine() {
    if (lines.empty()) {
        return std::nullopt;
    }
    std::string line = std::move(lines.front());
    lines.pop_front();
    return line;
}

std::size_t LineReader::discardLines() {
    const std::size_t count = lines.size();
    lines.clear();
    return count;
}

void LineReader::reset() {
    pending.clear();
    skipping = false;
    lines.clear();
}

} // namespace wellscan::motion
