#include <cmath>

#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "crop_survey/geometry.hpp"
#include "crop_survey/obstacle_router.hpp"

using namespace crop_survey;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    crop_survey::test::ensure_logger_initialized();
    return true;
}();

MultiPolygon square(double min_x, double min_y, double max_x, double max_y) {
    return MultiPolygon{Polygon{{min_x, min_y}, {max_x, min_y}, {max_x, max_y}, {min_x, max_y}}};
}
}  // namespace

TEST_CASE("find_detour picks the shortest clear side") {
    const MultiPolygon blocking = square(4.0, 4.0, 6.0, 6.0);

    const std::optional<DetourRoute> detour = find_detour(Point2D{0.0, 4.5}, Point2D{10.0, 4.5}, blocking, 0.5);

    REQUIRE(detour.has_value());
    REQUIRE(detour->side == DetourSide::Bottom);
    REQUIRE(detour->via_points.size() == 2);
    REQUIRE(detour->via_points[0].x == Approx(3.5));
    REQUIRE(detour->via_points[0].y == Approx(3.5));
    REQUIRE(detour->via_points[1].x == Approx(6.5));
    REQUIRE(detour->via_points[1].y == Approx(3.5));
    REQUIRE(to_string(detour->side) == "bottom");
}

TEST_CASE("find_detour visits the corner nearer the start first") {
    const MultiPolygon blocking = square(4.0, 4.0, 6.0, 6.0);

    const std::optional<DetourRoute> detour = find_detour(Point2D{10.0, 5.5}, Point2D{0.0, 5.5}, blocking, 0.5);

    REQUIRE(detour.has_value());
    REQUIRE(detour->side == DetourSide::Top);
    REQUIRE(detour->via_points[0].x == Approx(6.5));
    REQUIRE(detour->via_points[1].x == Approx(3.5));
}

TEST_CASE("find_detour reports failure when the start lies inside the obstacle") {
    const MultiPolygon blocking = square(5.0, 5.0, 7.0, 7.0);

    REQUIRE_FALSE(find_detour(Point2D{6.0, 6.0}, Point2D{10.0, 6.0}, blocking, 0.5).has_value());
}

TEST_CASE("find_detour falls back to the blocker's nearest vertices") {
    // Comb-shaped blocker: two notches open at the top, split by a spike whose apex is (5, 10).
    // Every bounding-box corner route cuts through an arm or the spike.
    const MultiPolygon blocking{Polygon{
        {0.0, 0.0}, {10.0, 0.0}, {10.0, 10.0}, {8.0, 10.0}, {8.0, 3.0}, {6.0, 3.0},
        {5.0, 10.0}, {4.0, 3.0}, {2.0, 3.0}, {2.0, 10.0}, {0.0, 10.0},
    }};
    const Point2D from{3.8, 9.0};
    const Point2D to{6.2, 9.0};
    REQUIRE(geometry::path_intersects(geometry::Path{from, to}, blocking));

    const std::optional<DetourRoute> detour = find_detour(from, to, blocking, 0.5);

    REQUIRE(detour.has_value());
    REQUIRE(detour->side == DetourSide::Boundary);
    REQUIRE(detour->via_points.size() == 1);
    REQUIRE(detour->via_points[0] == Point2D{5.0, 10.0});
    REQUIRE(detour->length_m == Approx(2.0 * std::hypot(1.2, 1.0)));
}

TEST_CASE("ObstacleRouter inserts detour waypoints around a blocked hop") {
    const ObstacleRouter router{{square(4.0, 4.0, 6.0, 6.0)}, 0.5};
    const std::vector<SweepPoint> sweep{
        SweepPoint{Point2D{0.0, 4.5}, 2.0, 0},
        SweepPoint{Point2D{10.0, 4.5}, 2.0, 0},
    };

    const RoutingResult result = router.route(sweep, 2.0);

    REQUIRE(result.detour_count == 1);
    REQUIRE(result.unrouted_count == 0);
    REQUIRE(result.waypoints.size() == 4);
    REQUIRE(result.waypoints[1] == Waypoint{350, 350, 200});
    REQUIRE(result.waypoints[2] == Waypoint{650, 350, 200});
    REQUIRE(result.waypoints[3] == Waypoint{1000, 450, 200});
    REQUIRE(router.unsafe_segments(result.waypoints).empty());
}

TEST_CASE("ObstacleRouter keeps unroutable hops and flags them as unsafe") {
    const ObstacleRouter router{{square(5.0, 5.0, 7.0, 7.0)}, 0.5};
    const std::vector<SweepPoint> sweep{
        SweepPoint{Point2D{6.0, 6.0}, 2.0, 0},
        SweepPoint{Point2D{10.0, 6.0}, 2.0, 0},
    };

    const RoutingResult result = router.route(sweep, 2.0);

    REQUIRE(result.unrouted_count == 1);
    REQUIRE(result.waypoints.size() == 2);
    REQUIRE(router.unsafe_segments(result.waypoints) == std::vector<std::size_t>{0});
}

TEST_CASE("ObstacleRouter leaves clear hops untouched") {
    const ObstacleRouter router{{square(4.0, 4.0, 6.0, 6.0)}, 0.5};
    const std::vector<SweepPoint> sweep{
        SweepPoint{Point2D{0.0, 0.0}, 2.0, 0},
        SweepPoint{Point2D{10.0, 0.0}, 2.0, 0},
        SweepPoint{Point2D{10.0, 2.0}, 2.0, 1},
    };

    const RoutingResult result = router.route(sweep, 2.0);

    REQUIRE(result.detour_count == 0);
    REQUIRE(result.waypoints.size() == 3);
}
