#include "crop_survey/geometry.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include <stdexcept>

#include "clipper2/clipper.h"

namespace crop_survey::geometry {

namespace {

constexpr double k_clipper_scale{1000.0};           /**< Integer grid resolution: one unit per millimetre. */
constexpr double k_intersection_tolerance_m{0.05};  /**< Clipped length below which a path only grazes a region. */
constexpr double k_scan_inset_m{1e-6};              /**< Inset applied to scan lines lying on the region's extreme edges. */

Clipper2Lib::Path64 to_clipper_path(const Polygon& ring) {
    Clipper2Lib::Path64 path;
    path.reserve(ring.size());
    for (const Point2D& point : ring) {
        path.emplace_back(
            static_cast<int64_t>(std::llround(point.x * k_clipper_scale)),
            static_cast<int64_t>(std::llround(point.y * k_clipper_scale))
        );
    }
    return path;
}

Clipper2Lib::Paths64 to_clipper_paths(const MultiPolygon& region) {
    Clipper2Lib::Paths64 paths;
    paths.reserve(region.size());
    for (const Polygon& ring : region) {
        if (ring.size() >= 2) {
            paths.push_back(to_clipper_path(ring));
        }
    }
    return paths;
}

Polygon from_clipper_path(const Clipper2Lib::Path64& path) {
    Polygon ring;
    ring.reserve(path.size());
    for (const Clipper2Lib::Point64& point : path) {
        ring.push_back(Point2D{
            static_cast<double>(point.x) / k_clipper_scale,
            static_cast<double>(point.y) / k_clipper_scale
        });
    }
    return ring;
}

MultiPolygon from_clipper_paths(const Clipper2Lib::Paths64& paths) {
    MultiPolygon region;
    region.reserve(paths.size());
    for (const Clipper2Lib::Path64& path : paths) {
        if (path.size() >= 3) {
            region.push_back(from_clipper_path(path));
        }
    }
    return region;
}

double cross(const Point2D& origin, const Point2D& a, const Point2D& b) {
    return (a.x - origin.x) * (b.y - origin.y) - (a.y - origin.y) * (b.x - origin.x);
}

bool on_segment(const Point2D& a, const Point2D& b, const Point2D& p) {
    return std::min(a.x, b.x) <= p.x && p.x <= std::max(a.x, b.x)
        && std::min(a.y, b.y) <= p.y && p.y <= std::max(a.y, b.y);
}

bool segments_touch(const Point2D& p1, const Point2D& p2, const Point2D& q1, const Point2D& q2) {
    const double d1 = cross(q1, q2, p1);
    const double d2 = cross(q1, q2, p2);
    const double d3 = cross(p1, p2, q1);
    const double d4 = cross(p1, p2, q2);

    if (((d1 > 0.0 && d2 < 0.0) || (d1 < 0.0 && d2 > 0.0))
        && ((d3 > 0.0 && d4 < 0.0) || (d3 < 0.0 && d4 > 0.0))) {
        return true;
    }
    return (d1 == 0.0 && on_segment(q1, q2, p1))
        || (d2 == 0.0 && on_segment(q1, q2, p2))
        || (d3 == 0.0 && on_segment(p1, p2, q1))
        || (d4 == 0.0 && on_segment(p1, p2, q2));
}

}  // namespace

double signed_area(const Polygon& ring) {
    if (ring.size() < 3) {
        return 0.0;
    }
    double twice_area = 0.0;
    for (std::size_t index = 0; index < ring.size(); ++index) {
        const Point2D& current = ring[index];
        const Point2D& next = ring[(index + 1) % ring.size()];
        twice_area += current.x * next.y - next.x * current.y;
    }
    return twice_area / 2.0;
}

double area(const MultiPolygon& region) {
    double total = 0.0;
    for (const Polygon& ring : region) {
        total += signed_area(ring);
    }
    return std::max(0.0, total);
}

Point2D centroid(const Polygon& ring) {
    const double ring_area = signed_area(ring);
    if (ring.empty()) {
        return Point2D{};
    }
    if (std::abs(ring_area) <= std::numeric_limits<double>::epsilon()) {
        Point2D mean{};
        for (const Point2D& point : ring) {
            mean.x += point.x;
            mean.y += point.y;
        }
        const auto count = static_cast<double>(ring.size());
        return Point2D{mean.x / count, mean.y / count};
    }

    double sum_x = 0.0;
    double sum_y = 0.0;
    for (std::size_t index = 0; index < ring.size(); ++index) {
        const Point2D& current = ring[index];
        const Point2D& next = ring[(index + 1) % ring.size()];
        const double factor = current.x * next.y - next.x * current.y;
        sum_x += (current.x + next.x) * factor;
        sum_y += (current.y + next.y) * factor;
    }
    return Point2D{sum_x / (6.0 * ring_area), sum_y / (6.0 * ring_area)};
}

Bounds bounds(const Polygon& ring) {
    return bounds(MultiPolygon{ring});
}

Bounds bounds(const MultiPolygon& region) {
    Bounds box{
        std::numeric_limits<double>::max(),
        std::numeric_limits<double>::max(),
        std::numeric_limits<double>::lowest(),
        std::numeric_limits<double>::lowest()
    };
    bool has_point = false;
    for (const Polygon& ring : region) {
        for (const Point2D& point : ring) {
            box.min_x = std::min(box.min_x, point.x);
            box.min_y = std::min(box.min_y, point.y);
            box.max_x = std::max(box.max_x, point.x);
            box.max_y = std::max(box.max_y, point.y);
            has_point = true;
        }
    }
    return has_point ? box : Bounds{};
}

Polygon normalized(Polygon ring) {
    while (ring.size() > 1 && ring.front() == ring.back()) {
        ring.pop_back();
    }
    if (signed_area(ring) < 0.0) {
        std::reverse(ring.begin(), ring.end());
    }
    return ring;
}

bool is_simple(const Polygon& ring) {
    const std::size_t count = ring.size();
    if (count < 3) {
        return false;
    }
    for (std::size_t first = 0; first < count; ++first) {
        const Point2D& a1 = ring[first];
        const Point2D& a2 = ring[(first + 1) % count];
        if (a1 == a2) {
            return false;
        }
        for (std::size_t second = first + 1; second < count; ++second) {
            const bool adjacent = second == first + 1 || (first == 0 && second == count - 1);
            if (adjacent) {
                continue;
            }
            const Point2D& b1 = ring[second];
            const Point2D& b2 = ring[(second + 1) % count];
            if (segments_touch(a1, a2, b1, b2)) {
                return false;
            }
        }
    }
    return true;
}

MultiPolygon union_of(const MultiPolygon& region) {
    const Clipper2Lib::Paths64 united = Clipper2Lib::Union(to_clipper_paths(region), Clipper2Lib::FillRule::NonZero);
    return from_clipper_paths(united);
}

MultiPolygon difference(const MultiPolygon& subject, const MultiPolygon& clip) {
    if (clip.empty()) {
        return union_of(subject);
    }
    const Clipper2Lib::Paths64 result = Clipper2Lib::Difference(
        to_clipper_paths(subject),
        to_clipper_paths(clip),
        Clipper2Lib::FillRule::NonZero
    );
    return from_clipper_paths(result);
}

MultiPolygon intersection(const MultiPolygon& subject, const MultiPolygon& clip) {
    const Clipper2Lib::Paths64 result = Clipper2Lib::Intersect(
        to_clipper_paths(subject),
        to_clipper_paths(clip),
        Clipper2Lib::FillRule::NonZero
    );
    return from_clipper_paths(result);
}

MultiPolygon buffer(const MultiPolygon& region, double margin_m) {
    if (margin_m <= 0.0) {
        return union_of(region);
    }
    const Clipper2Lib::Paths64 inflated = Clipper2Lib::InflatePaths(
        to_clipper_paths(region),
        margin_m * k_clipper_scale,
        Clipper2Lib::JoinType::Round,
        Clipper2Lib::EndType::Polygon
    );
    return from_clipper_paths(inflated);
}

std::vector<MultiPolygon> components(const MultiPolygon& region) {
    std::vector<MultiPolygon> list_components;
    MultiPolygon list_holes;
    for (const Polygon& ring : region) {
        if (signed_area(ring) > 0.0) {
            list_components.push_back(MultiPolygon{ring});
        } else {
            list_holes.push_back(ring);
        }
    }

    for (const Polygon& hole : list_holes) {
        if (hole.empty()) {
            continue;
        }
        const Clipper2Lib::Point64 probe = to_clipper_path(Polygon{hole.front()}).front();
        for (MultiPolygon& component : list_components) {
            const Clipper2Lib::PointInPolygonResult location = Clipper2Lib::PointInPolygon(probe, to_clipper_path(component.front()));
            if (location != Clipper2Lib::PointInPolygonResult::IsOutside) {
                component.push_back(hole);
                break;
            }
        }
    }
    return list_components;
}

std::vector<Segment> clip_horizontal_line(const MultiPolygon& region, double y) {
    std::vector<Segment> list_segments;
    if (region.empty()) {
        return list_segments;
    }

    const Bounds box = bounds(region);
    if (y < box.min_y || y > box.max_y || box.max_y - box.min_y <= 2.0 * k_scan_inset_m) {
        return list_segments;
    }
    const double y_eval = std::clamp(y, box.min_y + k_scan_inset_m, box.max_y - k_scan_inset_m);

    std::vector<double> list_crossings;
    for (const Polygon& ring : region) {
        for (std::size_t index = 0; index < ring.size(); ++index) {
            const Point2D& a = ring[index];
            const Point2D& b = ring[(index + 1) % ring.size()];
            const bool crosses = (a.y <= y_eval && y_eval < b.y) || (b.y <= y_eval && y_eval < a.y);
            if (!crosses) {
                continue;
            }
            list_crossings.push_back(a.x + (y_eval - a.y) * (b.x - a.x) / (b.y - a.y));
        }
    }
    std::sort(list_crossings.begin(), list_crossings.end());

    for (std::size_t index = 0; index + 1 < list_crossings.size(); index += 2) {
        const double start_x = list_crossings[index];
        const double end_x = list_crossings[index + 1];
        if (end_x - start_x <= 0.0) {
            continue;
        }
        list_segments.push_back(Segment{Point2D{start_x, y}, Point2D{end_x, y}});
    }
    return list_segments;
}

double clipped_length(const Path& path, const MultiPolygon& region) {
    if (path.size() < 2 || region.empty()) {
        return 0.0;
    }

    Clipper2Lib::Clipper64 clipper;
    clipper.AddOpenSubject(Clipper2Lib::Paths64{to_clipper_path(path)});
    clipper.AddClip(to_clipper_paths(region));

    Clipper2Lib::Paths64 closed_solution;
    Clipper2Lib::Paths64 open_solution;
    if (!clipper.Execute(Clipper2Lib::ClipType::Intersection, Clipper2Lib::FillRule::NonZero, closed_solution, open_solution)) {
        throw std::runtime_error("Clipper2 failed to clip path against region");
    }

    double total_m = 0.0;
    for (const Clipper2Lib::Path64& piece : open_solution) {
        total_m += path_length(from_clipper_path(piece));
    }
    return total_m;
}

bool path_intersects(const Path& path, const MultiPolygon& region) {
    return clipped_length(path, region) > k_intersection_tolerance_m;
}

double path_length(const Path& path) {
    double total = 0.0;
    for (std::size_t index = 1; index < path.size(); ++index) {
        total += distance(path[index - 1], path[index]);
    }
    return total;
}

double distance(const Point2D& from, const Point2D& to) {
    return std::hypot(to.x - from.x, to.y - from.y);
}

}  // namespace crop_survey::geometry
