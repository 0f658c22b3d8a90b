// === Geometry ================================================================
//
// Single entry point for all planar polygon work: measurement, boolean
// algebra, buffering, scan-line clipping and path/region intersection tests.
// Boolean operations are delegated to Clipper2 on a millimetre integer grid;
// nothing outside this module touches the Clipper2 API.

#pragma once

#include <vector>

#include "crop_survey/types.hpp"

namespace crop_survey::geometry {

/** @brief Horizontal run of a scan line that lies inside a region. */
struct Segment final {
    Point2D start{};
    Point2D end{};
};

/** @brief Open polyline in metres. */
using Path = std::vector<Point2D>;

/** @brief Signed shoelace area; positive for counter-clockwise rings. */
[[nodiscard]] double signed_area(const Polygon& ring);

/** @brief Net area of a region, holes subtracted. */
[[nodiscard]] double area(const MultiPolygon& region);

/** @brief Area-weighted centroid of a simple ring. */
[[nodiscard]] Point2D centroid(const Polygon& ring);

[[nodiscard]] Bounds bounds(const Polygon& ring);
[[nodiscard]] Bounds bounds(const MultiPolygon& region);

/** @brief Drop a repeated closing vertex and orient the ring counter-clockwise. */
[[nodiscard]] Polygon normalized(Polygon ring);

/** @brief True when no two non-adjacent edges of the ring touch or cross. */
[[nodiscard]] bool is_simple(const Polygon& ring);

[[nodiscard]] MultiPolygon union_of(const MultiPolygon& region);
[[nodiscard]] MultiPolygon difference(const MultiPolygon& subject, const MultiPolygon& clip);
[[nodiscard]] MultiPolygon intersection(const MultiPolygon& subject, const MultiPolygon& clip);

/** @brief Grow every ring outward by @p margin_m with rounded corners. */
[[nodiscard]] MultiPolygon buffer(const MultiPolygon& region, double margin_m);

/** @brief Split a region into outer rings, each followed by the holes it contains. */
[[nodiscard]] std::vector<MultiPolygon> components(const MultiPolygon& region);

/**
 * @brief Intersect the horizontal line at @p y with @p region.
 *
 * Segments are returned in ascending x with start.x < end.x. A line lying on
 * the region's lowest or highest edge is evaluated just inside the region so
 * boundary tracks are not lost.
 */
[[nodiscard]] std::vector<Segment> clip_horizontal_line(const MultiPolygon& region, double y);

/** @brief Length of the parts of @p path lying inside @p region. */
[[nodiscard]] double clipped_length(const Path& path, const MultiPolygon& region);

/**
 * @brief True when @p path crosses the interior of @p region.
 *
 * Touching the boundary or grazing a vertex is not an intersection.
 */
[[nodiscard]] bool path_intersects(const Path& path, const MultiPolygon& region);

[[nodiscard]] double path_length(const Path& path);

[[nodiscard]] double distance(const Point2D& from, const Point2D& to);

}  // namespace crop_survey::geometry
