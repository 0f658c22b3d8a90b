// === Obstacle Router =========================================================
//
// Walks the raw sweep and, wherever a straight hop between consecutive
// vertices would cross a buffered obstacle, inserts detour waypoints around
// the obstacles that block that hop. Sweep vertices themselves are never
// moved. Hops that cannot be routed safely are left straight and reported.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

#include "crop_survey/geometry.hpp"
#include "crop_survey/grid_sweep.hpp"
#include "crop_survey/logging.hpp"
#include "crop_survey/types.hpp"

namespace crop_survey {

/** @brief Which way a detour passes the blocking geometry. */
enum class DetourSide {
    Top,       /**< Over the top edge of the bounding box. */
    Bottom,    /**< Under the bottom edge of the bounding box. */
    Left,      /**< Around the left edge of the bounding box. */
    Right,     /**< Around the right edge of the bounding box. */
    Boundary   /**< Via the blocking geometry's own nearest vertices. */
};

[[nodiscard]] std::string_view to_string(DetourSide side) noexcept;

/** @brief Intermediate points that carry a hop around its blockers. */
struct DetourRoute final {
    DetourSide side{DetourSide::Top};
    std::vector<Point2D> via_points{}; /**< Points inserted between the hop's endpoints. */
    double length_m{};                 /**< Length of the full from→via→to path. */
};

/**
 * @brief Choose the shortest safe detour from @p from to @p to around @p blocking.
 *
 * Four candidates use the corners of the blocking bounding box grown by
 * @p corner_buffer_m, tried in the order top, bottom, left, right. The first
 * of several equally short candidates wins. When no corner route is clear,
 * the vertices of the blocking outline nearest each endpoint are tried.
 *
 * @return std::nullopt when neither strategy yields a clear path.
 */
[[nodiscard]] std::optional<DetourRoute> find_detour(
    const Point2D& from,
    const Point2D& to,
    const MultiPolygon& blocking,
    double corner_buffer_m
);

/** @brief Sweep converted into waypoints with detours inserted. */
struct RoutingResult final {
    std::vector<Waypoint> waypoints{};
    std::size_t detour_count{};   /**< Hops that received a detour. */
    std::size_t unrouted_count{}; /**< Blocked hops left straight. */
};

/** @brief Inserts detours around individually buffered obstacles. */
class ObstacleRouter final {
  public:
    ObstacleRouter(std::vector<MultiPolygon> buffered_obstacles, double corner_buffer_m);

    [[nodiscard]] RoutingResult route(const std::vector<SweepPoint>& sweep, double altitude_m) const;

    /** @brief Indices i of hops waypoints[i]→waypoints[i+1] that cross a buffered obstacle. */
    [[nodiscard]] std::vector<std::size_t> unsafe_segments(const std::vector<Waypoint>& waypoints) const;

  private:
    /** @brief Union of only the obstacles that @p hop crosses; empty when clear. */
    [[nodiscard]] MultiPolygon blocking_geometry(const geometry::Path& hop) const;

    std::vector<MultiPolygon> list_buffered_obstacles_;
    MultiPolygon buffered_union_;
    double corner_buffer_m_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace crop_survey
