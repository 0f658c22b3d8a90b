#include "crop_survey/obstacle_router.hpp"

#include <array>
#include <limits>
#include <utility>

#include "crop_survey/waypoint_processor.hpp"

namespace crop_survey {

namespace {

using CornerPair = std::pair<Point2D, Point2D>;

/**
 * @brief Outer ring of the blocking geometry used for boundary fall-back routing.
 */
const Polygon* first_outer_ring(const MultiPolygon& blocking) {
    for (const Polygon& ring : blocking) {
        if (geometry::signed_area(ring) > 0.0) {
            return &ring;
        }
    }
    return blocking.empty() ? nullptr : &blocking.front();
}

Point2D nearest_vertex(const Polygon& ring, const Point2D& target) {
    Point2D best = ring.front();
    double best_distance = std::numeric_limits<double>::max();
    for (const Point2D& vertex : ring) {
        const double candidate_distance = geometry::distance(vertex, target);
        if (candidate_distance < best_distance) {
            best_distance = candidate_distance;
            best = vertex;
        }
    }
    return best;
}

geometry::Path full_path(const Point2D& from, const std::vector<Point2D>& via_points, const Point2D& to) {
    geometry::Path path;
    path.reserve(via_points.size() + 2);
    path.push_back(from);
    path.insert(path.end(), via_points.begin(), via_points.end());
    path.push_back(to);
    return path;
}

std::optional<DetourRoute> boundary_detour(const Point2D& from, const Point2D& to, const MultiPolygon& blocking) {
    const Polygon* ring = first_outer_ring(blocking);
    if (ring == nullptr || ring->empty()) {
        return std::nullopt;
    }

    DetourRoute route{};
    route.side = DetourSide::Boundary;
    const Point2D closest_to_start = nearest_vertex(*ring, from);
    const Point2D closest_to_end = nearest_vertex(*ring, to);
    route.via_points.push_back(closest_to_start);
    if (closest_to_end != closest_to_start) {
        route.via_points.push_back(closest_to_end);
    }

    const geometry::Path path = full_path(from, route.via_points, to);
    if (geometry::path_intersects(path, blocking)) {
        return std::nullopt;
    }
    route.length_m = geometry::path_length(path);
    return route;
}

}  // namespace

std::string_view to_string(DetourSide side) noexcept {
    switch (side) {
        case DetourSide::Top:
            return "top";
        case DetourSide::Bottom:
            return "bottom";
        case DetourSide::Left:
            return "left";
        case DetourSide::Right:
            return "right";
        case DetourSide::Boundary:
            return "boundary";
    }
    return "unknown";
}

std::optional<DetourRoute> find_detour(
    const Point2D& from,
    const Point2D& to,
    const MultiPolygon& blocking,
    double corner_buffer_m
) {
    if (blocking.empty()) {
        return std::nullopt;
    }

    const Bounds box = geometry::bounds(blocking);
    const Point2D top_left{box.min_x - corner_buffer_m, box.max_y + corner_buffer_m};
    const Point2D top_right{box.max_x + corner_buffer_m, box.max_y + corner_buffer_m};
    const Point2D bottom_left{box.min_x - corner_buffer_m, box.min_y - corner_buffer_m};
    const Point2D bottom_right{box.max_x + corner_buffer_m, box.min_y - corner_buffer_m};

    const std::array<std::pair<DetourSide, CornerPair>, 4> candidates{{
        {DetourSide::Top, {top_left, top_right}},
        {DetourSide::Bottom, {bottom_left, bottom_right}},
        {DetourSide::Left, {top_left, bottom_left}},
        {DetourSide::Right, {top_right, bottom_right}},
    }};

    std::optional<DetourRoute> best_route;
    for (const auto& [side, corners] : candidates) {
        // Visit the corner nearer the start first so the route does not double back.
        std::vector<Point2D> via_points{corners.first, corners.second};
        if (geometry::distance(from, corners.second) < geometry::distance(from, corners.first)) {
            std::swap(via_points[0], via_points[1]);
        }

        const geometry::Path path = full_path(from, via_points, to);
        if (geometry::path_intersects(path, blocking)) {
            continue;
        }
        const double length_m = geometry::path_length(path);
        if (!best_route.has_value() || length_m < best_route->length_m) {
            best_route = DetourRoute{side, std::move(via_points), length_m};
        }
    }

    if (best_route.has_value()) {
        return best_route;
    }
    return boundary_detour(from, to, blocking);
}

ObstacleRouter::ObstacleRouter(std::vector<MultiPolygon> buffered_obstacles, double corner_buffer_m)
    : list_buffered_obstacles_(std::move(buffered_obstacles)),
      corner_buffer_m_(corner_buffer_m),
      logger_(get_logger()) {
    MultiPolygon all_rings;
    for (const MultiPolygon& obstacle : list_buffered_obstacles_) {
        all_rings.insert(all_rings.end(), obstacle.begin(), obstacle.end());
    }
    if (!all_rings.empty()) {
        buffered_union_ = geometry::union_of(all_rings);
    }
}

RoutingResult ObstacleRouter::route(const std::vector<SweepPoint>& sweep, double altitude_m) const {
    RoutingResult result{};
    result.waypoints.reserve(sweep.size());

    for (std::size_t index = 0; index < sweep.size(); ++index) {
        const SweepPoint& current = sweep[index];
        result.waypoints.push_back(make_waypoint(current.position, current.altitude_m));

        if (index + 1 >= sweep.size() || list_buffered_obstacles_.empty()) {
            continue;
        }
        const SweepPoint& next = sweep[index + 1];
        const MultiPolygon blocking = blocking_geometry(geometry::Path{current.position, next.position});
        if (blocking.empty()) {
            continue;
        }

        const std::optional<DetourRoute> detour = find_detour(current.position, next.position, blocking, corner_buffer_m_);
        if (!detour.has_value()) {
            ++result.unrouted_count;
            logger_->warn(
                "No safe detour from ({:.2f}, {:.2f}) to ({:.2f}, {:.2f}); segment left crossing an obstacle",
                current.position.x,
                current.position.y,
                next.position.x,
                next.position.y
            );
            continue;
        }

        if (detour->side == DetourSide::Boundary) {
            logger_->info("Complex obstacle between sweep points {} and {}; using boundary routing", index, index + 1);
        }
        logger_->debug("Detour {} with {} points ({:.2f} m) after sweep point {}", to_string(detour->side), detour->via_points.size(), detour->length_m, index);
        for (const Point2D& via_point : detour->via_points) {
            result.waypoints.push_back(make_waypoint(via_point, altitude_m));
        }
        ++result.detour_count;
    }
    return result;
}

std::vector<std::size_t> ObstacleRouter::unsafe_segments(const std::vector<Waypoint>& waypoints) const {
    std::vector<std::size_t> list_unsafe;
    if (buffered_union_.empty()) {
        return list_unsafe;
    }
    for (std::size_t index = 0; index + 1 < waypoints.size(); ++index) {
        const geometry::Path hop{planar_position(waypoints[index]), planar_position(waypoints[index + 1])};
        if (geometry::path_intersects(hop, buffered_union_)) {
            list_unsafe.push_back(index);
        }
    }
    return list_unsafe;
}

MultiPolygon ObstacleRouter::blocking_geometry(const geometry::Path& hop) const {
    MultiPolygon blocking_rings;
    std::size_t blocker_count = 0;
    for (const MultiPolygon& obstacle : list_buffered_obstacles_) {
        if (geometry::path_intersects(hop, obstacle)) {
            blocking_rings.insert(blocking_rings.end(), obstacle.begin(), obstacle.end());
            ++blocker_count;
        }
    }
    if (blocker_count <= 1) {
        return blocking_rings;
    }
    return geometry::union_of(blocking_rings);
}

}  // namespace crop_survey
