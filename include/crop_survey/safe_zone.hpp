// === Safe-Zone Builder =======================================================
//
// Subtracts buffered obstacles and no-fly zones from the field outline. The
// result may be several disjoint polygons, possibly with holes, when
// obstacles split the field.

#pragma once

#include <vector>

#include "crop_survey/types.hpp"

namespace crop_survey {

/** @brief Flyable region plus the buffered exclusions it was carved from. */
struct SafeZone final {
    MultiPolygon region{};                         /**< Field minus buffered exclusions. */
    MultiPolygon buffered_exclusions{};            /**< Union of all exclusions, grown by the margin. */
    std::vector<MultiPolygon> buffered_obstacles{}; /**< Each exclusion grown by the margin on its own. */
    double area_sqm{};                             /**< Net area of the flyable region. */
};

/**
 * @brief Build the safe zone for @p field.
 *
 * @throws GeometryInfeasibleError when the exclusions cover the whole field.
 */
[[nodiscard]] SafeZone build_safe_zone(const Polygon& field, const std::vector<Polygon>& exclusions, double buffer_m);

}  // namespace crop_survey
