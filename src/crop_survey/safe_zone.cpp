#include "crop_survey/safe_zone.hpp"

#include "crop_survey/errors.hpp"
#include "crop_survey/geometry.hpp"
#include "crop_survey/logging.hpp"

namespace crop_survey {

namespace {
constexpr double k_min_safe_area_sqm{0.01}; /**< Residual area treated as fully obstructed. */
}

SafeZone build_safe_zone(const Polygon& field, const std::vector<Polygon>& exclusions, double buffer_m) {
    SafeZone zone{};
    const MultiPolygon field_region{geometry::normalized(field)};

    if (exclusions.empty()) {
        zone.region = field_region;
    } else {
        MultiPolygon exclusion_region;
        exclusion_region.reserve(exclusions.size());
        for (const Polygon& exclusion : exclusions) {
            exclusion_region.push_back(geometry::normalized(exclusion));
            zone.buffered_obstacles.push_back(geometry::buffer(MultiPolygon{exclusion_region.back()}, buffer_m));
        }
        zone.buffered_exclusions = geometry::buffer(geometry::union_of(exclusion_region), buffer_m);
        zone.region = geometry::difference(field_region, zone.buffered_exclusions);
    }

    zone.area_sqm = geometry::area(zone.region);
    if (zone.region.empty() || zone.area_sqm < k_min_safe_area_sqm) {
        throw GeometryInfeasibleError("field fully obstructed: no flyable area remains after removing buffered obstacles");
    }

    auto logger = get_logger();
    logger->debug("Safe zone has {} rings covering {:.1f} m² ({} exclusions)", zone.region.size(), zone.area_sqm, exclusions.size());
    return zone;
}

}  // namespace crop_survey
