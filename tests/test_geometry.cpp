#include <catch2/catch.hpp>

#include "crop_survey/field_splitter.hpp"
#include "crop_survey/geometry.hpp"

using namespace crop_survey;

namespace {
Polygon square(double min_x, double min_y, double max_x, double max_y) {
    return Polygon{{min_x, min_y}, {max_x, min_y}, {max_x, max_y}, {min_x, max_y}};
}
}  // namespace

TEST_CASE("normalized drops the closing vertex and orients counter-clockwise") {
    const Polygon clockwise{{0.0, 0.0}, {0.0, 2.0}, {2.0, 2.0}, {2.0, 0.0}, {0.0, 0.0}};

    const Polygon ring = geometry::normalized(clockwise);

    REQUIRE(ring.size() == 4);
    REQUIRE(geometry::signed_area(ring) == Approx(4.0));
}

TEST_CASE("is_simple rejects a bow-tie polygon") {
    const Polygon bow_tie{{0.0, 0.0}, {2.0, 2.0}, {2.0, 0.0}, {0.0, 2.0}};

    REQUIRE_FALSE(geometry::is_simple(bow_tie));
    REQUIRE(geometry::is_simple(square(0.0, 0.0, 1.0, 1.0)));
}

TEST_CASE("difference carves a hole out of the field") {
    const MultiPolygon field{square(0.0, 0.0, 10.0, 10.0)};
    const MultiPolygon obstacle{square(4.0, 4.0, 6.0, 6.0)};

    const MultiPolygon remaining = geometry::difference(field, obstacle);

    REQUIRE(geometry::area(remaining) == Approx(96.0));
    REQUIRE(geometry::components(remaining).size() == 1);
    REQUIRE(geometry::components(remaining).front().size() == 2);
}

TEST_CASE("buffer grows a square by the margin with rounded corners") {
    const MultiPolygon grown = geometry::buffer(MultiPolygon{square(5.0, 5.0, 7.0, 7.0)}, 2.0);
    const Bounds box = geometry::bounds(grown);

    REQUIRE(box.min_x == Approx(3.0).margin(0.01));
    REQUIRE(box.max_y == Approx(9.0).margin(0.01));
    // 2x2 core, four 2x2 side bands and a full circle of radius 2.
    REQUIRE(geometry::area(grown) == Approx(4.0 + 16.0 + 3.14159 * 4.0).epsilon(0.01));
}

TEST_CASE("clip_horizontal_line splits a scan line around a hole") {
    const MultiPolygon region = geometry::difference(
        MultiPolygon{square(0.0, 0.0, 10.0, 10.0)},
        MultiPolygon{square(4.0, 4.0, 6.0, 6.0)}
    );

    const std::vector<geometry::Segment> list_segments = geometry::clip_horizontal_line(region, 5.0);

    REQUIRE(list_segments.size() == 2);
    REQUIRE(list_segments[0].start.x == Approx(0.0).margin(1e-6));
    REQUIRE(list_segments[0].end.x == Approx(4.0).margin(1e-6));
    REQUIRE(list_segments[1].start.x == Approx(6.0).margin(1e-6));
    REQUIRE(list_segments[1].end.x == Approx(10.0).margin(1e-6));
    REQUIRE(list_segments[0].start.y == Approx(5.0));
}

TEST_CASE("clip_horizontal_line keeps scan lines on the region's outer edges") {
    const MultiPolygon region{square(0.0, 0.0, 10.0, 10.0)};

    REQUIRE(geometry::clip_horizontal_line(region, 0.0).size() == 1);
    REQUIRE(geometry::clip_horizontal_line(region, 10.0).size() == 1);
    REQUIRE(geometry::clip_horizontal_line(region, 10.5).empty());
}

TEST_CASE("path_intersects ignores paths that only touch the boundary") {
    const MultiPolygon obstacle{square(4.0, 4.0, 6.0, 6.0)};

    REQUIRE(geometry::path_intersects(geometry::Path{{0.0, 5.0}, {10.0, 5.0}}, obstacle));
    REQUIRE_FALSE(geometry::path_intersects(geometry::Path{{0.0, 6.0}, {4.0, 6.0}}, obstacle));
    REQUIRE_FALSE(geometry::path_intersects(geometry::Path{{0.0, 0.0}, {10.0, 0.0}}, obstacle));
    REQUIRE(geometry::clipped_length(geometry::Path{{0.0, 5.0}, {10.0, 5.0}}, obstacle) == Approx(2.0).margin(0.01));
}

TEST_CASE("split_into_strips covers the field with equal-width strips") {
    const Polygon field = square(0.0, 0.0, 30.0, 10.0);

    const std::vector<Polygon> list_strips = split_into_strips(field, 3, 1.0);

    REQUIRE(list_strips.size() == 3);
    double total_area = 0.0;
    for (const Polygon& strip : list_strips) {
        REQUIRE(geometry::signed_area(strip) == Approx(100.0));
        total_area += geometry::signed_area(strip);
    }
    REQUIRE(total_area == Approx(300.0));
    REQUIRE_THROWS_AS(split_into_strips(field, 0, 1.0), std::invalid_argument);
}

TEST_CASE("split_into_strips separates disjoint pieces of a concave field") {
    // C-shaped field opening to the right: the two right strips each cut both arms.
    const Polygon c_shape{{0.0, 0.0}, {30.0, 0.0}, {30.0, 5.0}, {10.0, 5.0}, {10.0, 15.0}, {30.0, 15.0}, {30.0, 20.0}, {0.0, 20.0}};

    const std::vector<Polygon> list_strips = split_into_strips(c_shape, 3, 1.0);

    REQUIRE(list_strips.size() == 5);
    REQUIRE(geometry::signed_area(list_strips[0]) == Approx(200.0));
    for (std::size_t index = 1; index < list_strips.size(); ++index) {
        REQUIRE(geometry::signed_area(list_strips[index]) == Approx(50.0));
    }
}
