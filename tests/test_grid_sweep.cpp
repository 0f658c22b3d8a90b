#include <catch2/catch.hpp>

#include "crop_survey/grid_sweep.hpp"

using namespace crop_survey;

TEST_CASE("Lawnmower sweep alternates direction on a rectangle") {
    const MultiPolygon field{Polygon{{0.0, 0.0}, {10.0, 0.0}, {10.0, 5.0}, {0.0, 5.0}}};

    const std::vector<SweepPoint> sweep = generate_sweep(field, 2.0, 2.0);

    REQUIRE(sweep.size() == 6);
    REQUIRE(sweep[0].position.x == Approx(0.0).margin(1e-6));
    REQUIRE(sweep[1].position.x == Approx(10.0).margin(1e-6));
    REQUIRE(sweep[2].position.x == Approx(10.0).margin(1e-6));
    REQUIRE(sweep[3].position.x == Approx(0.0).margin(1e-6));
    REQUIRE(sweep[4].position.x == Approx(0.0).margin(1e-6));
    REQUIRE(sweep[5].position.x == Approx(10.0).margin(1e-6));

    REQUIRE(sweep[0].position.y == Approx(0.0));
    REQUIRE(sweep[2].position.y == Approx(2.0));
    REQUIRE(sweep[5].position.y == Approx(4.0));
    REQUIRE(sweep[3].track_index == 1);
    REQUIRE(sweep[5].altitude_m == Approx(2.0));
}

TEST_CASE("Sweep emits one pair per segment when a track crosses a hole") {
    const MultiPolygon field{
        Polygon{{0.0, 0.0}, {10.0, 0.0}, {10.0, 10.0}, {0.0, 10.0}},
        Polygon{{4.0, 4.0}, {4.0, 6.0}, {6.0, 6.0}, {6.0, 4.0}},
    };

    const std::vector<SweepPoint> sweep = generate_sweep(field, 5.0, 2.0);

    // Tracks at y = 0, 5, 10; the middle (odd) track runs right to left in two pieces.
    REQUIRE(sweep.size() == 8);
    REQUIRE(sweep[2].position.x == Approx(10.0).margin(1e-6));
    REQUIRE(sweep[3].position.x == Approx(6.0).margin(1e-6));
    REQUIRE(sweep[4].position.x == Approx(4.0).margin(1e-6));
    REQUIRE(sweep[5].position.x == Approx(0.0).margin(1e-6));
}

TEST_CASE("Sweep rejects non-positive track spacing") {
    const MultiPolygon field{Polygon{{0.0, 0.0}, {10.0, 0.0}, {10.0, 5.0}, {0.0, 5.0}}};

    REQUIRE_THROWS_AS(generate_sweep(field, 0.0, 2.0), std::invalid_argument);
    REQUIRE(generate_sweep(MultiPolygon{}, 1.0, 2.0).empty());
}
