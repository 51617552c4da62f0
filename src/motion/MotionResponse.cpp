#include "wellscan/motion/MotionResponse.hpp"

#include <cctype>
#include <cstdlib>
#include <string>

namespace wellscan::motion {

namespace {

bool containsIgnoreCase(std::string_view haystack, std::string_view needle) {
    if (needle.size() > haystack.size()) {
        return false;
    }
    for (std::size_t i = 0; i + needle.size() <= haystack.size(); ++i) {
        std::size_t k = 0;
        while (k < needle.size() &&
               std::tolower(static_cast<unsigned char>(haystack[i + k])) ==
               std::tolower(static_cast<unsigned char>(needle[k]))) {
            ++k;
        }
        if (k == needle.size()) {
            return true;
        }
    }
    return false;
}

} // namespace

AckKind classifyAck(std::string_view line) {
    if (containsIgnoreCase(line, "ok")) {
        return AckKind::Ok;
    }
    if (containsIgnoreCase(line, "error")) {
        return AckKind::Error;
    }
    return AckKind::None;
}

std::optional<geometry::Point3> parsePosition(std::string_view line) {
    std::optional<double> x;
    std::optional<double> y;
    std::optional<double> z;

    std::size_t pos = 0;
    while (pos < line.size()) {
        while (pos < line.size() && std::isspace(static_cast<unsigned char>(line[pos]))) {
            ++pos;
        }
        std::size_t end = pos;
        while (end < line.size() && !std::isspace(static_cast<unsigned char>(line[end]))) {
            ++end;
        }
        const std::string token(line.substr(pos, end - pos));
        pos = end;

        if (token.empty()) {
            continue;
        }
        if (token.compare(0, 5, "Count") == 0) {
            break;
        }
        if (token.size() < 3 || token[1] != ':') {
            continue;
        }

        const char* begin = token.c_str() + 2;
        char* parsedEnd = nullptr;
        const double value = std::strtod(begin, &parsedEnd);
        if (parsedEnd == begin) {
            continue;
        }
        switch (std::toupper(static_cast<unsigned char>(token[0]))) {
            case 'X': x = value; break;
            case 'Y': y = value; break;
            case 'Z': z = value; break;
            default: break;
        }
    }

    if (!x || !y || !z) {
        return std::nullopt;
    }
    return geometry::Point3{*x, *y, *z};
}

} // namespace wellscan::motion
