#include <catch2/catch.hpp>

#include "logging_test_fixture.hpp"
#include "crop_survey/errors.hpp"
#include "crop_survey/geometry.hpp"
#include "crop_survey/safe_zone.hpp"

using namespace crop_survey;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    crop_survey::test::ensure_logger_initialized();
    return true;
}();

const Polygon k_garden{{0.0, 0.0}, {20.0, 0.0}, {20.0, 15.0}, {0.0, 15.0}};
}  // namespace

TEST_CASE("Safe zone without exclusions is the whole field") {
    const SafeZone zone = build_safe_zone(k_garden, {}, 2.0);

    REQUIRE(zone.area_sqm == Approx(300.0));
    REQUIRE(zone.buffered_obstacles.empty());
}

TEST_CASE("Safe zone removes each exclusion grown by the buffer") {
    const Polygon tree{{5.0, 5.0}, {7.0, 5.0}, {7.0, 7.0}, {5.0, 7.0}};

    const SafeZone zone = build_safe_zone(k_garden, {tree}, 2.0);

    REQUIRE(zone.buffered_obstacles.size() == 1);
    REQUIRE(zone.area_sqm < 300.0 - 4.0);
    REQUIRE(zone.area_sqm == Approx(300.0 - 32.57).epsilon(0.01));

    const Bounds box = geometry::bounds(zone.buffered_obstacles.front());
    REQUIRE(box.min_x == Approx(3.0).margin(0.01));
    REQUIRE(box.max_x == Approx(9.0).margin(0.01));
}

TEST_CASE("Safe zone clips exclusions that extend past the field") {
    const Polygon hedge{{-5.0, -5.0}, {25.0, -5.0}, {25.0, 1.0}, {-5.0, 1.0}};

    const SafeZone zone = build_safe_zone(k_garden, {hedge}, 1.0);

    REQUIRE(zone.area_sqm == Approx(20.0 * 13.0).epsilon(0.001));
}

TEST_CASE("Fully obstructed field raises GeometryInfeasibleError") {
    REQUIRE_THROWS_AS(build_safe_zone(k_garden, {k_garden}, 2.0), GeometryInfeasibleError);
}
