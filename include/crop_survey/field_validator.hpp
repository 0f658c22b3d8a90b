// === Field Validator =========================================================
//
// Advisory checks of a field against the vehicle's communication range and
// per-battery coverage. Failing a check produces a warning, never an error;
// battery infeasibility is reported separately on the planned mission.

#pragma once

#include <string>
#include <vector>

#include "crop_survey/types.hpp"
#include "crop_survey/vehicle_profile.hpp"

namespace crop_survey {

/** @brief Outcome of the advisory field checks. */
struct ValidationResult final {
    bool valid{};                              /**< True when no warning was raised. */
    double field_area_sqm{};                   /**< Shoelace area of the field boundary. */
    double max_coverage_per_flight_sqm{};      /**< Coverage estimate for one battery cycle. */
    double max_distance_from_center_m{};       /**< Farthest boundary vertex from the centroid. */
    std::vector<std::string> warnings{};       /**< Human-readable warnings in check order. */
};

[[nodiscard]] ValidationResult validate_field_size(
    const Polygon& boundary,
    const VehicleProfile& profile,
    double altitude_m,
    double overlap_fraction
);

}  // namespace crop_survey
