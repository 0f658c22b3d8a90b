#include "crop_survey/mission_io.hpp"

#include <fstream>
#include <stdexcept>

#include "crop_survey/logging.hpp"

namespace crop_survey {

namespace {
constexpr int k_json_indent{2};

nlohmann::json waypoint_to_json(const Waypoint& waypoint) {
    return nlohmann::json{{"x", waypoint.x_cm}, {"y", waypoint.y_cm}, {"z", waypoint.z_cm}};
}

nlohmann::json validation_to_json(const ValidationResult& validation) {
    return nlohmann::json{
        {"valid", validation.valid},
        {"field_area_sqm", validation.field_area_sqm},
        {"max_coverage_per_flight", validation.max_coverage_per_flight_sqm},
        {"max_distance_from_center", validation.max_distance_from_center_m},
        {"warnings", validation.warnings},
    };
}
}  // namespace

nlohmann::json mission_to_json(const Mission& mission) {
    nlohmann::json list_waypoints = nlohmann::json::array();
    for (const Waypoint& waypoint : mission.waypoints) {
        list_waypoints.push_back(waypoint_to_json(waypoint));
    }

    nlohmann::json document{
        {"success", true},
        {"field_id", mission.field_id},
        {"field_name", mission.field_name},
        {"pattern", "grid"},
        {"waypoints", std::move(list_waypoints)},
        {"altitude", mission.altitude_cm},
        {"overlap_pct", mission.overlap_fraction},
        {"total_waypoints", mission.total_waypoints},
        {"estimated_duration_sec", mission.estimated_duration_sec},
        {"estimated_battery_pct", mission.estimated_battery_pct},
        {"batteries_needed", mission.batteries_needed},
        {"total_distance_m", mission.total_distance_m},
        {"coverage_area_sqm", mission.coverage_area_sqm},
        {"validation", validation_to_json(mission.validation)},
        {"is_feasible", mission.is_feasible},
        {"warnings", mission.warnings},
        {"routing_warnings", mission.routing_warnings},
        {"unsafe_segments", mission.unsafe_segments},
    };
    if (mission.reference_point.has_value()) {
        document["reference_point"] = {
            {"lat", mission.reference_point->latitude_deg},
            {"lon", mission.reference_point->longitude_deg},
        };
    }
    return document;
}

nlohmann::json adaptive_plan_to_json(const AdaptivePlan& plan) {
    nlohmann::json list_missions = nlohmann::json::array();
    for (const Mission& mission : plan.missions) {
        list_missions.push_back(mission_to_json(mission));
    }
    return nlohmann::json{
        {"success", true},
        {"type", plan.multi_flight ? "multi_flight" : "single_flight"},
        {"num_flights", plan.missions.size()},
        {"missions", std::move(list_missions)},
        {"field_id", plan.field_id},
        {"field_name", plan.field_name},
        {"total_area_sqm", plan.total_area_sqm},
        {"warnings", plan.warnings},
    };
}

std::filesystem::path save_flight_plan(const nlohmann::json& document, const std::filesystem::path& output_path) {
    std::ofstream output_stream{output_path};
    if (!output_stream) {
        throw std::runtime_error("Unable to open flight plan output at " + output_path.string());
    }
    output_stream << document.dump(k_json_indent) << '\n';
    if (!output_stream) {
        throw std::runtime_error("Failed writing flight plan to " + output_path.string());
    }
    get_logger()->info("Flight plan saved: {}", output_path.string());
    return output_path;
}

}  // namespace crop_survey
