// === Grid Sweep Generator ====================================================
//
// Boustrophedon (lawnmower) coverage of the safe zone: horizontal tracks
// spaced one effective footprint apart, flown alternately left-to-right and
// right-to-left.

#pragma once

#include <vector>

#include "crop_survey/types.hpp"

namespace crop_survey {

/** @brief Raw sweep vertex in metres, before routing and rounding. */
struct SweepPoint final {
    Point2D position{};   /**< Planar position on the track. */
    double altitude_m{};  /**< Requested flight altitude. */
    int track_index{};    /**< Zero-based track the vertex belongs to. */
};

/**
 * @brief Generate the ordered sweep over @p safe_zone.
 *
 * Even tracks run toward +x and odd tracks toward -x. Tracks that miss the
 * safe zone contribute nothing.
 *
 * @throws std::invalid_argument when @p spacing_m is not positive.
 */
[[nodiscard]] std::vector<SweepPoint> generate_sweep(const MultiPolygon& safe_zone, double spacing_m, double altitude_m);

}  // namespace crop_survey
