// === Waypoint Post-Processor =================================================
//
// Conversion of planar positions into centimetre waypoints, streaming
// near-duplicate removal, and order-preserving subsampling down to the
// battery-derived waypoint cap.

#pragma once

#include <vector>

#include "crop_survey/types.hpp"
#include "crop_survey/vehicle_profile.hpp"

namespace crop_survey {

/** @brief Round a position in metres to a centimetre waypoint. */
[[nodiscard]] Waypoint make_waypoint(const Point2D& position, double altitude_m);

/** @brief Planar position of a waypoint in metres. */
[[nodiscard]] Point2D planar_position(const Waypoint& waypoint);

/**
 * @brief Drop waypoints closer than @p threshold_cm to the previously kept one.
 *
 * Only the planar distance counts and the first waypoint is always kept.
 */
[[nodiscard]] std::vector<Waypoint> remove_duplicate_waypoints(const std::vector<Waypoint>& waypoints, int threshold_cm);

/** @brief Largest waypoint count that fits one battery cycle with margin. */
[[nodiscard]] int calculate_max_waypoints(const VehicleProfile& profile);

/**
 * @brief Evenly subsample to exactly @p max_waypoints, keeping both endpoints.
 *
 * Lists already within the cap are returned unchanged. Caps below two are
 * raised to two so the endpoints are never dropped.
 */
[[nodiscard]] std::vector<Waypoint> subsample_waypoints(const std::vector<Waypoint>& waypoints, int max_waypoints);

}  // namespace crop_survey
