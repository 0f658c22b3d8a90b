#include "crop_survey/footprint.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace crop_survey {

namespace {
constexpr double degrees_to_radians(double degrees) {
    return degrees * std::numbers::pi / 180.0;
}
}  // namespace

CameraFootprint camera_footprint(const VehicleProfile& profile, double altitude_m) {
    const double fov_h_rad = degrees_to_radians(profile.camera().horizontal_fov_deg);
    const double fov_v_rad = degrees_to_radians(profile.camera().vertical_fov_deg);
    return CameraFootprint{
        2.0 * altitude_m * std::tan(fov_h_rad / 2.0),
        2.0 * altitude_m * std::tan(fov_v_rad / 2.0)
    };
}

double track_spacing(const VehicleProfile& profile, double altitude_m, double overlap_fraction) {
    return camera_footprint(profile, altitude_m).width_m * (1.0 - overlap_fraction);
}

double max_coverage_per_cycle(const VehicleProfile& profile, double altitude_m, double overlap_fraction) {
    const MissionTiming& timing = profile.timing();
    const double usable_time_sec = static_cast<double>(profile.usable_flight_time_sec()) - timing.takeoff_landing_sec;
    const double flight_time_sec = std::max(0.0, usable_time_sec - timing.coverage_hover_budget_sec);
    const double sweep_distance_m = flight_time_sec * profile.envelope().max_speed_mps;
    return sweep_distance_m * track_spacing(profile, altitude_m, overlap_fraction);
}

}  // namespace crop_survey
