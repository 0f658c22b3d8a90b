#include "crop_survey/grid_sweep.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

#include "crop_survey/geometry.hpp"

namespace crop_survey {

std::vector<SweepPoint> generate_sweep(const MultiPolygon& safe_zone, double spacing_m, double altitude_m) {
    if (!(spacing_m > 0.0)) {
        throw std::invalid_argument("Sweep track spacing must be positive");
    }

    std::vector<SweepPoint> list_points;
    if (safe_zone.empty()) {
        return list_points;
    }

    const Bounds box = geometry::bounds(safe_zone);
    const int track_count = static_cast<int>(std::floor((box.max_y - box.min_y) / spacing_m)) + 1;

    for (int track_index = 0; track_index < track_count; ++track_index) {
        const double y = box.min_y + track_index * spacing_m;
        const bool left_to_right = track_index % 2 == 0;

        std::vector<geometry::Segment> list_segments = geometry::clip_horizontal_line(safe_zone, y);
        for (geometry::Segment& segment : list_segments) {
            if (!left_to_right) {
                std::swap(segment.start, segment.end);
            }
        }
        std::sort(
            list_segments.begin(),
            list_segments.end(),
            [left_to_right](const geometry::Segment& lhs, const geometry::Segment& rhs) {
                return left_to_right ? lhs.start.x < rhs.start.x : lhs.start.x > rhs.start.x;
            }
        );

        for (const geometry::Segment& segment : list_segments) {
            list_points.push_back(SweepPoint{segment.start, altitude_m, track_index});
            list_points.push_back(SweepPoint{segment.end, altitude_m, track_index});
        }
    }
    return list_points;
}

}  // namespace crop_survey
