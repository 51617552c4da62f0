#include "TestSupport.hpp"

#include "wellscan/core/Error.hpp"
#include "wellscan/geometry/Geometry.hpp"
#include "wellscan/geometry/PlateLayout.hpp"

#include <string>
#include <vector>

using namespace wellscan;
using namespace wellscan::geometry;

static CornerSet rectangle(double width, double height, double z = 0.0) {
    CornerSet corners;
    corners.set(Corner::TopLeft, {0.0, 0.0, z});
    corners.set(Corner::TopRight, {width, 0.0, z});
    corners.set(Corner::BottomLeft, {0.0, height, z});
    corners.set(Corner::BottomRight, {width, height, z});
    return corners;
}

static std::string joined(const std::vector<WellId>& wells) {
    std::string out;
    for (const auto& well : wells) {
        out += out.empty() ? "" : " ";
        out += well.toString();
    }
    return out;
}

static void testThreeByFourExample() {
    const auto corners = rectangle(30.0, 20.0);
    const WellGrid grid{3, 4};

    struct Expect { const char* well; Point3 p; };
    const Expect cases[] = {
        {"A1", {0, 0, 0}}, {"A4", {30, 0, 0}}, {"C1", {0, 20, 0}},
        {"C4", {30, 20, 0}}, {"B2", {10, 10, 0}},
    };
    for (const auto& c : cases) {
        auto p = calculateWellPosition(corners, grid, c.well);
        ASSERT_TRUE(p.has_value(), c.well);
        if (p) {
            ASSERT_TRUE(*p == c.p, c.well);
        }
    }
}

static void testCornersReproducedOnSkewedPlate() {
    CornerSet corners;
    corners.set(Corner::TopLeft, {12.34, 56.78, 1.5});
    corners.set(Corner::TopRight, {110.02, 57.91, 1.7});
    corners.set(Corner::BottomLeft, {11.05, 120.66, 1.4});
    corners.set(Corner::BottomRight, {109.87, 121.3, 1.9});
    const WellGrid grid{8, 12};

    ASSERT_TRUE(*calculateWellPosition(corners, grid, "A1") == corners.at(Corner::TopLeft), "A1 == top left");
    ASSERT_TRUE(*calculateWellPosition(corners, grid, "A12") == corners.at(Corner::TopRight), "A12 == top right");
    ASSERT_TRUE(*calculateWellPosition(corners, grid, "H1") == corners.at(Corner::BottomLeft), "H1 == bottom left");
    ASSERT_TRUE(*calculateWellPosition(corners, grid, "H12") == corners.at(Corner::BottomRight), "H12 == bottom right");
}

static void testRoundingToTwoDecimals() {
    const auto corners = rectangle(10.0, 10.0);
    auto p = calculateWellPosition(corners, WellGrid{1, 4}, "A2");
    ASSERT_TRUE(p.has_value(), "A2 on a single-row plate");
    ASSERT_EQ(p->x, 3.33, "x rounded to two decimals");
    ASSERT_EQ(p->y, 0.0, "single row sits on the top edge");
}

static void testSingleWellPlate() {
    const auto corners = rectangle(30.0, 20.0, 4.0);
    auto p = calculateWellPosition(corners, WellGrid{1, 1}, "A1");
    ASSERT_TRUE(p && *p == (Point3{0.0, 0.0, 4.0}), "1x1 plate uses the top-left corner");
}

static void testErrors() {
    CornerSet partial;
    partial.set(Corner::TopLeft, {0, 0, 0});
    partial.set(Corner::BottomRight, {1, 1, 0});

    auto incomplete = calculateWellPosition(partial, WellGrid{2, 2}, "A1");
    ASSERT_TRUE(!incomplete && incomplete.error() == Errc::IncompleteCorners, "incomplete corners");

    const auto missing = partial.missing();
    ASSERT_EQ(missing.size(), std::size_t{2}, "two corners missing");
    ASSERT_EQ(std::string(cornerName(missing[0])), std::string("Bottom Left"), "first missing name");
    ASSERT_EQ(std::string(cornerName(missing[1])), std::string("Top Right"), "second missing name");

    const auto corners = rectangle(30.0, 20.0);
    auto outside = calculateWellPosition(corners, WellGrid{3, 4}, "D1");
    ASSERT_TRUE(!outside && outside.error() == Errc::InvalidWell, "row outside grid");
    auto column = calculateWellPosition(corners, WellGrid{3, 4}, "A5");
    ASSERT_TRUE(!column && column.error() == Errc::InvalidWell, "column outside grid");
    auto garbage = calculateWellPosition(corners, WellGrid{3, 4}, "1A");
    ASSERT_TRUE(!garbage && garbage.error() == Errc::InvalidWell, "malformed identifier");

    auto grid = calculateWellPositions(corners, WellGrid{0, 4});
    ASSERT_TRUE(!grid && grid.error() == Errc::InvalidGrid, "zero rows");
    ASSERT_TRUE(!(WellGrid{27, 1}.valid()), "more rows than letters");
}

static void testWellIdParsing() {
    auto lower = WellId::parse("b3");
    ASSERT_TRUE(lower && lower->row == 1 && lower->col == 2, "lower-case row letter");
    ASSERT_EQ(lower->toString(), std::string("B3"), "formatted upper-case");

    ASSERT_TRUE(!WellId::parse(""), "empty");
    ASSERT_TRUE(!WellId::parse("A"), "no column");
    ASSERT_TRUE(!WellId::parse("A0"), "column zero");
    ASSERT_TRUE(!WellId::parse("AA1"), "two-letter row");
    ASSERT_TRUE(!WellId::parse("B3", WellGrid{2, 3}), "row outside grid");

    auto a10 = *WellId::parse("A10");
    auto a2 = *WellId::parse("A2");
    auto b1 = *WellId::parse("B1");
    ASSERT_TRUE(a2 < a10, "A2 sorts before A10");
    ASSERT_TRUE(a10 < b1, "A10 sorts before B1");
}

static void testVisitOrder() {
    ASSERT_EQ(joined(generateVisitOrder(WellGrid{2, 3})), std::string("A1 A2 A3 B3 B2 B1"), "2x3 snake");
    ASSERT_EQ(joined(generateVisitOrder(WellGrid{3, 2})), std::string("A1 A2 B2 B1 C1 C2"), "3x2 snake");
    ASSERT_EQ(joined(allWells(WellGrid{2, 2})), std::string("A1 A2 B1 B2"), "raster order");
    ASSERT_TRUE(generateVisitOrder(WellGrid{0, 3}).empty(), "invalid grid has no order");

    const auto order = generateVisitOrder(WellGrid{8, 12});
    ASSERT_EQ(order.size(), std::size_t{96}, "every well visited once");
    ASSERT_TRUE(!isRowChange(order[10], order[11]), "A11 -> A12 stays in row");
    ASSERT_TRUE(isRowChange(order[11], order[12]), "A12 -> B12 changes row");
}

static void testPlateLayoutCache() {
    PlateLayout layout;
    ASSERT_TRUE(layout.setGrid(WellGrid{2, 2}).has_value(), "valid grid accepted");
    auto rejected = layout.setGrid(WellGrid{2, 0});
    ASSERT_TRUE(!rejected && rejected.error() == Errc::InvalidGrid, "invalid grid rejected");
    ASSERT_TRUE(layout.grid() == (WellGrid{2, 2}), "grid unchanged after rejection");

    ASSERT_TRUE(!layout.positions(), "no positions without corners");
    ASSERT_EQ(layout.missingCorners().size(), std::size_t{4}, "all four missing");

    layout.setCorner(Corner::TopLeft, {0, 0, 0});
    layout.setCorner(Corner::TopRight, {10, 0, 0});
    layout.setCorner(Corner::BottomLeft, {0, 10, 0});
    layout.setCorner(Corner::BottomRight, {10, 10, 0});
    auto before = layout.position(*WellId::parse("B2"));
    ASSERT_TRUE(before && *before == (Point3{10, 10, 0}), "B2 from initial corners");

    layout.setCorner(Corner::BottomRight, {20, 10, 0});
    auto after = layout.position(*WellId::parse("B2"));
    ASSERT_TRUE(after && *after == (Point3{20, 10, 0}), "B2 recomputed after corner change");

    ASSERT_TRUE(layout.setGrid(WellGrid{3, 3}).has_value(), "grid change");
    auto middle = layout.position(*WellId::parse("B2"));
    ASSERT_TRUE(middle && *middle == (Point3{7.5, 5, 0}), "B2 recomputed after grid change");

    layout.clearCorner(Corner::TopLeft);
    ASSERT_TRUE(!layout.positions(), "cleared corner invalidates positions");
    ASSERT_EQ(layout.missingCorners().front(), std::string("Top Left"), "cleared corner reported");
}

static void testFormatPoint() {
    ASSERT_EQ(formatPoint(Point3{1, 2.5, -3.456}), std::string("X=1.00, Y=2.50, Z=-3.46"), "point format");
}

int main() {
    testThreeByFourExample();
    testCornersReproducedOnSkewedPlate();
    testRoundingToTwoDecimals();
    testSingleWellPlate();
    testErrors();
    testWellIdParsing();
    testVisitOrder();
    testPlateLayoutCache();
    testFormatPoint();
    return finishTests("Geometry");
}
