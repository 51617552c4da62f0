#include "wellscan/geometry/WellId.hpp"
#include "wellscan/core/Error.hpp"

#include <cctype>

namespace wellscan::geometry {

std::string WellId::toString() const {
    std::string label;
    label.push_back(static_cast<char>('A' + row));
    label += std::to_string(col + 1);
    return label;
}

expected<WellId> WellId::parse(std::string_view text) {
    if (text.size() < 2) {
        return unexpected(make_error_code(Errc::InvalidWell));
    }

    const auto letter = static_cast<unsigned char>(text.front());
    if (!std::isalpha(letter)) {
        return unexpected(make_error_code(Errc::InvalidWell));
    }

    int column = 0;
    for (std::size_t i = 1; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (!std::isdigit(c)) {
            return unexpected(make_error_code(Errc::InvalidWell));
        }
        column = column * 10 + (c - '0');
        if (column > 100000) {
            return unexpected(make_error_code(Errc::InvalidWell));
        }
    }
    if (column < 1) {
        return unexpected(make_error_code(Errc::InvalidWell));
    }

    WellId id;
    id.row = std::toupper(letter) - 'A';
    id.col = column - 1;
    return id;
}

expected<WellId> WellId::parse(std::string_view text, const WellGrid& grid) {
    auto id = parse(text);
    if (!id) {
        return id;
    }
    if (!id->within(grid)) {
        return unexpected(make_error_code(Errc::InvalidWell));
    }
    return id;
}

} // namespace wellscan::geometry
