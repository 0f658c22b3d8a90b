#include "crop_survey/mission_metadata.hpp"

#include <algorithm>
#include <cmath>

namespace crop_survey {

namespace {
constexpr double k_cm_per_m{100.0};
constexpr double k_percent_scale{100.0};
}  // namespace

MissionMetadata calculate_mission_metadata(const std::vector<Waypoint>& waypoints, const VehicleProfile& profile) {
    MissionMetadata metadata{};
    if (waypoints.size() < 2) {
        return metadata;
    }

    double total_distance_cm = 0.0;
    for (std::size_t index = 1; index < waypoints.size(); ++index) {
        const Waypoint& from = waypoints[index - 1];
        const Waypoint& to = waypoints[index];
        total_distance_cm += std::sqrt(
            std::pow(static_cast<double>(to.x_cm - from.x_cm), 2)
            + std::pow(static_cast<double>(to.y_cm - from.y_cm), 2)
            + std::pow(static_cast<double>(to.z_cm - from.z_cm), 2)
        );
    }
    const double total_distance_m = total_distance_cm / k_cm_per_m;

    const MissionTiming& timing = profile.timing();
    const double flight_time_sec = total_distance_m / timing.cruise_speed_mps;
    const double hover_time_sec = static_cast<double>(waypoints.size()) * timing.hover_sec_per_waypoint;
    const double total_time_sec = flight_time_sec + hover_time_sec + timing.takeoff_landing_sec;

    const double battery_pct = total_time_sec / static_cast<double>(profile.usable_flight_time_sec()) * k_percent_scale;

    metadata.duration_sec = static_cast<int>(total_time_sec);
    metadata.battery_pct = static_cast<int>(battery_pct);
    metadata.batteries_needed = std::max(1, static_cast<int>(std::ceil(metadata.battery_pct / k_percent_scale)));
    metadata.distance_m = std::round(total_distance_m * k_cm_per_m) / k_cm_per_m;
    return metadata;
}

}  // namespace crop_survey
