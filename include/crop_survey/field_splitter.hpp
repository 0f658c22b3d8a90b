// === Field Splitter ==========================================================
//
// Cuts a field into equal-width vertical strips for multi-battery surveys.

#pragma once

#include <vector>

#include "crop_survey/types.hpp"

namespace crop_survey {

/**
 * @brief Split @p boundary into @p strip_count vertical strips of its bounding box.
 *
 * Each strip is intersected with the boundary; pieces smaller than
 * @p min_area_sqm are discarded. A non-convex field may yield several pieces
 * per strip; pieces are returned strip by strip, left to right.
 */
[[nodiscard]] std::vector<Polygon> split_into_strips(
    const Polygon& boundary,
    int strip_count,
    double min_area_sqm
);

}  // namespace crop_survey
