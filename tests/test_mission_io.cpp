#include <filesystem>
#include <fstream>

#include <catch2/catch.hpp>
#include <nlohmann/json.hpp>

#include "logging_test_fixture.hpp"
#include "crop_survey/mission_io.hpp"

using namespace crop_survey;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    crop_survey::test::ensure_logger_initialized();
    return true;
}();

Mission sample_mission() {
    Mission mission{};
    mission.field_id = "test_001";
    mission.field_name = "Backyard Garden";
    mission.waypoints = {Waypoint{0, 0, 200}, Waypoint{2000, 0, 200}};
    mission.total_waypoints = 2;
    mission.altitude_cm = 200;
    mission.overlap_fraction = 0.3;
    mission.estimated_battery_pct = 3;
    mission.batteries_needed = 1;
    mission.is_feasible = true;
    mission.reference_point = Georeference{32.7, -117.1};
    return mission;
}
}  // namespace

TEST_CASE("mission_to_json emits the flight-plan keys") {
    const nlohmann::json document = mission_to_json(sample_mission());

    REQUIRE(document.at("success").get<bool>());
    REQUIRE(document.at("pattern") == "grid");
    REQUIRE(document.at("altitude") == 200);
    REQUIRE(document.at("waypoints").size() == 2);
    REQUIRE(document.at("waypoints")[1].at("x") == 2000);
    REQUIRE(document.at("total_waypoints") == 2);
    REQUIRE(document.at("is_feasible").get<bool>());
    REQUIRE(document.at("validation").contains("max_coverage_per_flight"));
    REQUIRE(document.at("routing_warnings").empty());
    REQUIRE(document.at("reference_point").at("lat").get<double>() == Approx(32.7));
}

TEST_CASE("adaptive_plan_to_json reports the flight count") {
    AdaptivePlan plan{};
    plan.field_id = "farm";
    plan.multi_flight = true;
    plan.missions = {sample_mission(), sample_mission()};

    const nlohmann::json document = adaptive_plan_to_json(plan);

    REQUIRE(document.at("type") == "multi_flight");
    REQUIRE(document.at("num_flights") == 2);
    REQUIRE(document.at("missions").size() == 2);
}

TEST_CASE("save_flight_plan writes indented JSON") {
    const auto path_output = std::filesystem::temp_directory_path() / "crop_survey_flight_plan_test.json";

    REQUIRE(save_flight_plan(mission_to_json(sample_mission()), path_output) == path_output);

    std::ifstream stream{path_output};
    const nlohmann::json reloaded = nlohmann::json::parse(stream);
    REQUIRE(reloaded.at("field_name") == "Backyard Garden");
    std::filesystem::remove(path_output);

    REQUIRE_THROWS_AS(
        save_flight_plan(nlohmann::json::object(), std::filesystem::temp_directory_path() / "missing_dir" / "plan.json"),
        std::runtime_error
    );
}
