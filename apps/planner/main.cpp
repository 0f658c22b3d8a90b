#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include <fmt/format.h>

#include "crop_survey/configuration.hpp"
#include "crop_survey/field_config.hpp"
#include "crop_survey/logging.hpp"
#include "crop_survey/mission_io.hpp"
#include "crop_survey/mission_planner.hpp"
#include "crop_survey/version.hpp"

namespace {
constexpr char k_default_output_path[] = "flight_plan.json";
constexpr char k_adaptive_flag[] = "--adaptive";

/** @brief 20 m x 15 m garden with a single tree. */
crop_survey::FieldConfig example_field() {
    using crop_survey::Point2D;

    crop_survey::FieldConfig field{};
    field.field_id = "test_001";
    field.name = "Backyard Garden";
    field.boundary = {Point2D{0.0, 0.0}, Point2D{20.0, 0.0}, Point2D{20.0, 15.0}, Point2D{0.0, 15.0}};
    field.obstacles.push_back(crop_survey::Obstacle{
        "tree",
        {Point2D{5.0, 5.0}, Point2D{7.0, 5.0}, Point2D{7.0, 7.0}, Point2D{5.0, 7.0}},
    });
    return field;
}

void print_mission_summary(const crop_survey::Mission& mission) {
    fmt::print("{}\n", mission.field_name);
    fmt::print("   Waypoints: {}\n", mission.total_waypoints);
    fmt::print("   Distance: {:.2f}m\n", mission.total_distance_m);
    fmt::print("   Est. duration: {}s ({}min {}s)\n",
               mission.estimated_duration_sec,
               mission.estimated_duration_sec / 60,
               mission.estimated_duration_sec % 60);
    fmt::print("   Est. battery: ~{}% ({} batteries)\n", mission.estimated_battery_pct, mission.batteries_needed);
    fmt::print("   Coverage: {:.0f}m²\n", mission.coverage_area_sqm);
    for (const std::string& warning : mission.routing_warnings) {
        fmt::print("   Routing: {}\n", warning);
    }
}
}  // namespace

int main(int argc, char** argv) {
    using namespace crop_survey;

    try {
        const Configuration configuration = ConfigurationLoader::load();

        if (const char* desired_level = std::getenv("CROP_SURVEY_LOG_LEVEL"); desired_level != nullptr) {
            set_log_level(desired_level);
        }

        bool adaptive = false;
        std::vector<std::string> list_positional{};
        for (int index = 1; index < argc; ++index) {
            if (std::strcmp(argv[index], k_adaptive_flag) == 0) {
                adaptive = true;
            } else {
                list_positional.emplace_back(argv[index]);
            }
        }

        const FieldConfig field = list_positional.empty() ? example_field() : load_field_config(list_positional[0]);
        const std::filesystem::path output_path = list_positional.size() > 1 ? std::filesystem::path{list_positional[1]} : std::filesystem::path{k_default_output_path};

        auto logger = get_logger();
        logger->info("crop_survey planner {} planning {}", k_version, field.name);

        const MissionPlanner planner{configuration.vehicle};
        const PlanningConfig& planning = configuration.planning;
        if (adaptive) {
            const AdaptivePlan plan = planner.plan_adaptive_mission(field, planning.altitude_m, planning.overlap_fraction);
            fmt::print("Adaptive plan: {} flight(s) over {:.0f}m²\n", plan.missions.size(), plan.total_area_sqm);
            for (const Mission& mission : plan.missions) {
                print_mission_summary(mission);
            }
            for (const std::string& warning : plan.warnings) {
                fmt::print("Warning: {}\n", warning);
            }
            save_flight_plan(adaptive_plan_to_json(plan), output_path);
        } else {
            const Mission mission = planner.plan_grid_mission(field, planning.altitude_m, planning.overlap_fraction, planning.optimize_for_battery);
            print_mission_summary(mission);
            for (const std::string& warning : mission.warnings) {
                fmt::print("Warning: {}\n", warning);
            }
            save_flight_plan(mission_to_json(mission), output_path);
        }
        fmt::print("Flight plan saved: {}\n", output_path.string());
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
