// === Footprint & Coverage Estimator ==========================================
//
// Derives the camera's ground footprint and the sweep track spacing from the
// flight altitude, plus a rough per-battery coverage estimate used to choose
// between single- and multi-flight planning.

#pragma once

#include "crop_survey/vehicle_profile.hpp"

namespace crop_survey {

/** @brief Ground rectangle imaged by the camera, metres. */
struct CameraFootprint final {
    double width_m{};  /**< Across-track extent. */
    double height_m{}; /**< Along-track extent. */
};

/**
 * @brief Ground footprint at @p altitude_m.
 *
 * Precondition: altitude_m > 0. Callers reject other altitudes upstream.
 */
[[nodiscard]] CameraFootprint camera_footprint(const VehicleProfile& profile, double altitude_m);

/** @brief Distance between adjacent sweep tracks for the requested overlap. */
[[nodiscard]] double track_spacing(const VehicleProfile& profile, double altitude_m, double overlap_fraction);

/**
 * @brief Rough upper bound on the area one battery cycle can sweep.
 *
 * Flight time left after takeoff, landing and a fixed hover allowance is
 * converted into sweep distance at the vehicle's maximum speed.
 */
[[nodiscard]] double max_coverage_per_cycle(const VehicleProfile& profile, double altitude_m, double overlap_fraction);

}  // namespace crop_survey
