#include "crop_survey/vehicle_profile.hpp"

#include <cmath>
#include <stdexcept>

namespace crop_survey {

namespace {
constexpr double k_seconds_per_minute{60.0};
constexpr int k_min_waypoint_capacity{2};  /**< A mission needs at least its first and last waypoint. */
}

VehicleProfile::VehicleProfile()
    : VehicleProfile(CameraModel{}, FlightEnvelope{}, BatteryModel{}, MissionTiming{}, PlanningTolerances{}) {}

VehicleProfile::VehicleProfile(
    CameraModel camera,
    FlightEnvelope envelope,
    BatteryModel battery,
    MissionTiming timing,
    PlanningTolerances tolerances
)
    : camera_(camera),
      envelope_(envelope),
      battery_(battery),
      timing_(timing),
      tolerances_(tolerances) {
    validate();
}

const CameraModel& VehicleProfile::camera() const noexcept {
    return camera_;
}

const FlightEnvelope& VehicleProfile::envelope() const noexcept {
    return envelope_;
}

const BatteryModel& VehicleProfile::battery() const noexcept {
    return battery_;
}

const MissionTiming& VehicleProfile::timing() const noexcept {
    return timing_;
}

const PlanningTolerances& VehicleProfile::tolerances() const noexcept {
    return tolerances_;
}

int VehicleProfile::usable_flight_time_sec() const noexcept {
    return static_cast<int>(battery_.battery_life_min * k_seconds_per_minute * (1.0 - battery_.reserve_fraction));
}

void VehicleProfile::validate() const {
    if (camera_.horizontal_fov_deg <= 0.0 || camera_.horizontal_fov_deg >= 180.0
        || camera_.vertical_fov_deg <= 0.0 || camera_.vertical_fov_deg >= 180.0) {
        throw std::invalid_argument("VehicleProfile camera field of view must lie in (0, 180) degrees");
    }
    if (envelope_.max_altitude_m <= envelope_.min_altitude_m) {
        throw std::invalid_argument("VehicleProfile altitude bounds are invalid");
    }
    if (envelope_.max_speed_mps <= 0.0 || envelope_.max_range_m <= 0.0) {
        throw std::invalid_argument("VehicleProfile speed and range must be positive");
    }
    if (battery_.battery_life_min <= 0.0 || battery_.reserve_fraction < 0.0 || battery_.reserve_fraction >= 1.0) {
        throw std::invalid_argument("VehicleProfile battery model is invalid");
    }
    if (timing_.cruise_speed_mps <= 0.0 || timing_.capacity_sec_per_waypoint <= 0.0) {
        throw std::invalid_argument("VehicleProfile timing speeds and per-waypoint costs must be positive");
    }
    if (timing_.capacity_safety_margin <= 0.0 || timing_.capacity_safety_margin > 1.0) {
        throw std::invalid_argument("VehicleProfile waypoint safety margin must lie in (0, 1]");
    }
    if (timing_.hover_sec_per_waypoint < 0.0 || timing_.takeoff_landing_sec < 0.0
        || timing_.coverage_hover_budget_sec < 0.0 || timing_.capacity_overhead_sec < 0.0) {
        throw std::invalid_argument("VehicleProfile timing overheads cannot be negative");
    }

    const auto usable_sec = static_cast<double>(usable_flight_time_sec());
    if (usable_sec <= timing_.takeoff_landing_sec + timing_.coverage_hover_budget_sec) {
        throw std::invalid_argument("VehicleProfile battery budget too small to cover takeoff, landing and hover allowance");
    }
    const double waypoint_capacity = std::floor((usable_sec - timing_.capacity_overhead_sec) / timing_.capacity_sec_per_waypoint)
        * timing_.capacity_safety_margin;
    if (waypoint_capacity < static_cast<double>(k_min_waypoint_capacity)) {
        throw std::invalid_argument("VehicleProfile battery budget leaves room for fewer than two waypoints");
    }
    if (tolerances_.obstacle_buffer_m < 0.0 || tolerances_.detour_buffer_m < 0.0 || tolerances_.duplicate_threshold_cm < 0) {
        throw std::invalid_argument("VehicleProfile tolerances cannot be negative");
    }
}

}  // namespace crop_survey
