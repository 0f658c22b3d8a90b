// === Core Types ==============================================================
//
// Collects the value types shared across the planner: field-local planar
// points, polygons, centimeter waypoints, and the opaque georeference carried
// through from field configuration files.

#pragma once

#include <optional>
#include <vector>

namespace crop_survey {

/**
 * @brief Point in field-local Cartesian coordinates, metres.
 */
struct Point2D final {
    double x{}; /**< Easting from the field origin in metres. */
    double y{}; /**< Northing from the field origin in metres. */

    friend bool operator==(const Point2D&, const Point2D&) = default;
};

/**
 * @brief Ordered ring of vertices. The closing vertex is implicit.
 */
using Polygon = std::vector<Point2D>;

/**
 * @brief Collection of rings. Outer rings are counter-clockwise, holes clockwise.
 */
using MultiPolygon = std::vector<Polygon>;

/**
 * @brief Axis-aligned bounding box in metres.
 */
struct Bounds final {
    double min_x{};
    double min_y{};
    double max_x{};
    double max_y{};
};

/**
 * @brief Flight waypoint in integer centimetres, as consumed by the vehicle link.
 */
struct Waypoint final {
    int x_cm{}; /**< Easting in centimetres. */
    int y_cm{}; /**< Northing in centimetres. */
    int z_cm{}; /**< Height above ground in centimetres. */

    friend bool operator==(const Waypoint&, const Waypoint&) = default;
};

/**
 * @brief Latitude/longitude of the field origin, used only for satellite alignment.
 */
struct Georeference final {
    double latitude_deg{};  /**< Latitude in decimal degrees. */
    double longitude_deg{}; /**< Longitude in decimal degrees. */
};

using OptionalGeoreference = std::optional<Georeference>;

}  // namespace crop_survey
