// === Mission Metadata ========================================================
//
// Flight distance, duration and battery estimates for a finished waypoint
// list.

#pragma once

#include <vector>

#include "crop_survey/types.hpp"
#include "crop_survey/vehicle_profile.hpp"

namespace crop_survey {

struct MissionMetadata final {
    int duration_sec{};       /**< Cruise plus hover plus takeoff/landing, whole seconds. */
    int battery_pct{};        /**< Share of the usable flight time, whole percent. */
    int batteries_needed{};   /**< Battery cycles needed to fly the mission. */
    double distance_m{};      /**< 3D path length rounded to centimetres. */
};

/**
 * @brief Estimate duration and battery use of flying @p waypoints in order.
 *
 * Lists with fewer than two waypoints have zero distance, duration and
 * battery use.
 */
[[nodiscard]] MissionMetadata calculate_mission_metadata(const std::vector<Waypoint>& waypoints, const VehicleProfile& profile);

}  // namespace crop_survey
