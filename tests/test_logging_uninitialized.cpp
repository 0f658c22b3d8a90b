// Built into its own test binary: nothing here may initialize the planner logger.

#include <catch2/catch.hpp>

#include "crop_survey/logging.hpp"
#include "crop_survey/mission_planner.hpp"

using namespace crop_survey;

TEST_CASE("Planning works before the planner logger is initialized") {
    REQUIRE(get_logger() != nullptr);

    FieldConfig field{};
    field.name = "Unlogged";
    field.boundary = Polygon{{0.0, 0.0}, {20.0, 0.0}, {20.0, 5.0}, {0.0, 5.0}};
    field.obstacles.push_back(Obstacle{"tree", Polygon{{9.0, 4.0}, {11.0, 4.0}, {11.0, 4.5}, {9.0, 4.5}}});

    const MissionPlanner planner{VehicleProfile{}};
    const Mission mission = planner.plan_grid_mission(field, 2.0, 0.3, true);

    REQUIRE(mission.total_waypoints > 0);
    REQUIRE(mission.is_feasible);
}
