#include "crop_survey/waypoint_processor.hpp"

#include <algorithm>
#include <cmath>

namespace crop_survey {

namespace {
constexpr double k_cm_per_m{100.0};
constexpr int k_min_kept_waypoints{2};

int to_centimetres(double metres) {
    return static_cast<int>(std::lround(metres * k_cm_per_m));
}
}  // namespace

Waypoint make_waypoint(const Point2D& position, double altitude_m) {
    return Waypoint{to_centimetres(position.x), to_centimetres(position.y), to_centimetres(altitude_m)};
}

Point2D planar_position(const Waypoint& waypoint) {
    return Point2D{waypoint.x_cm / k_cm_per_m, waypoint.y_cm / k_cm_per_m};
}

std::vector<Waypoint> remove_duplicate_waypoints(const std::vector<Waypoint>& waypoints, int threshold_cm) {
    std::vector<Waypoint> list_filtered;
    if (waypoints.empty()) {
        return list_filtered;
    }

    list_filtered.push_back(waypoints.front());
    for (std::size_t index = 1; index < waypoints.size(); ++index) {
        const Waypoint& candidate = waypoints[index];
        const Waypoint& last_kept = list_filtered.back();
        const double distance_cm = std::hypot(
            static_cast<double>(candidate.x_cm - last_kept.x_cm),
            static_cast<double>(candidate.y_cm - last_kept.y_cm)
        );
        if (distance_cm >= static_cast<double>(threshold_cm)) {
            list_filtered.push_back(candidate);
        }
    }
    return list_filtered;
}

int calculate_max_waypoints(const VehicleProfile& profile) {
    const MissionTiming& timing = profile.timing();
    const double available_sec = static_cast<double>(profile.usable_flight_time_sec()) - timing.capacity_overhead_sec;
    const double max_waypoints = std::floor(available_sec / timing.capacity_sec_per_waypoint);
    return static_cast<int>(max_waypoints * timing.capacity_safety_margin);
}

std::vector<Waypoint> subsample_waypoints(const std::vector<Waypoint>& waypoints, int max_waypoints) {
    // First and last waypoints always survive, whatever the cap.
    max_waypoints = std::max(max_waypoints, k_min_kept_waypoints);
    const auto count = static_cast<int>(waypoints.size());
    if (count <= max_waypoints) {
        return waypoints;
    }

    const double step = static_cast<double>(count) / static_cast<double>(max_waypoints);
    std::vector<Waypoint> list_sampled;
    list_sampled.reserve(static_cast<std::size_t>(max_waypoints));
    list_sampled.push_back(waypoints.front());
    for (int sample = 1; sample < max_waypoints - 1; ++sample) {
        const auto index = static_cast<std::size_t>(sample * step);
        list_sampled.push_back(waypoints[index]);
    }
    list_sampled.push_back(waypoints.back());
    return list_sampled;
}

}  // namespace crop_survey
