#include "crop_survey/field_validator.hpp"

#include <algorithm>
#include <cmath>

#include <fmt/format.h>

#include "crop_survey/footprint.hpp"
#include "crop_survey/geometry.hpp"

namespace crop_survey {

ValidationResult validate_field_size(
    const Polygon& boundary,
    const VehicleProfile& profile,
    double altitude_m,
    double overlap_fraction
) {
    ValidationResult result{};
    result.field_area_sqm = std::abs(geometry::signed_area(boundary));

    const Point2D center = geometry::centroid(boundary);
    for (const Point2D& vertex : boundary) {
        result.max_distance_from_center_m = std::max(result.max_distance_from_center_m, geometry::distance(center, vertex));
    }

    const FlightEnvelope& envelope = profile.envelope();
    if (result.max_distance_from_center_m > envelope.max_range_m) {
        result.warnings.push_back(fmt::format(
            "Field extends {:.1f}m from center (range limit: {:.0f}m)",
            result.max_distance_from_center_m,
            envelope.max_range_m
        ));
    }

    result.max_coverage_per_flight_sqm = max_coverage_per_cycle(profile, altitude_m, overlap_fraction);
    if (result.max_coverage_per_flight_sqm > 0.0 && result.field_area_sqm > result.max_coverage_per_flight_sqm) {
        const auto flights_needed = static_cast<int>(std::ceil(result.field_area_sqm / result.max_coverage_per_flight_sqm));
        result.warnings.push_back(fmt::format(
            "Field requires ~{} battery cycles (area: {:.0f}m², max per flight: {:.0f}m²)",
            flights_needed,
            result.field_area_sqm,
            result.max_coverage_per_flight_sqm
        ));
    }

    if (altitude_m < envelope.min_altitude_m || altitude_m > envelope.max_altitude_m) {
        result.warnings.push_back(fmt::format(
            "Altitude {:.1f}m outside vehicle limits [{:.1f}m, {:.1f}m]",
            altitude_m,
            envelope.min_altitude_m,
            envelope.max_altitude_m
        ));
    }

    result.valid = result.warnings.empty();
    return result;
}

}  // namespace crop_survey
