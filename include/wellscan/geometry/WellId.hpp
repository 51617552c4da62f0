#pragma once

#include "wellscan/core/Expected.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace wellscan::geometry {

/// Rows are labelled with a single letter, so a plate has at most 26 rows.
constexpr int kMaxRows = 26;

/**
 * @brief Plate dimensions. Identifiers run A..(A+rows-1) by 1..cols.
 */
struct WellGrid {
    int rows = 1;
    int cols = 1;

    bool valid() const { return rows >= 1 && rows <= kMaxRows && cols >= 1; }
    std::size_t wellCount() const {
        return valid() ? static_cast<std::size_t>(rows) * static_cast<std::size_t>(cols) : 0;
    }
};

inline bool operator==(const WellGrid& a, const WellGrid& b) {
    return a.rows == b.rows && a.cols == b.cols;
}
inline bool operator!=(const WellGrid& a, const WellGrid& b) { return !(a == b); }

/**
 * @brief Zero-based (row, column) address of a well, formatted as "B3".
 *
 * Ordered row-major so maps keyed by WellId iterate in plate order
 * (A1, A2, ..., A10, B1) rather than string order.
 */
struct WellId {
    int row = 0;
    int col = 0;

    /// "A1"-style label: row letter plus 1-based column.
    std::string toString() const;

    /// Accepts "b3" or "B3". Rejects empty, multi-letter rows and column 0.
    static expected<WellId> parse(std::string_view text);

    /// parse() plus a range check against @p grid.
    static expected<WellId> parse(std::string_view text, const WellGrid& grid);

    bool within(const WellGrid& grid) const {
        return grid.valid() && row >= 0 && row < grid.rows && col >= 0 && col < grid.cols;
    }
};

inline bool operator==(const WellId& a, const WellId& b) { return a.row == b.row && a.col == b.col; }
inline bool operator!=(const WellId& a, const WellId& b) { return !(a == b); }
inline bool operator<(const WellId& a, const WellId& b) {
    return a.row != b.row ? a.row < b.row : a.col < b.col;
}

} // namespace wellscan::geometry
