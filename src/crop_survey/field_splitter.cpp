#include "crop_survey/field_splitter.hpp"

#include <stdexcept>

#include "crop_survey/geometry.hpp"

namespace crop_survey {

std::vector<Polygon> split_into_strips(
    const Polygon& boundary,
    int strip_count,
    double min_area_sqm
) {
    if (strip_count <= 0) {
        throw std::invalid_argument("Strip count must be positive");
    }

    const MultiPolygon field_region{geometry::normalized(boundary)};
    const Bounds box = geometry::bounds(field_region);
    const double strip_width = (box.max_x - box.min_x) / static_cast<double>(strip_count);

    std::vector<Polygon> list_pieces;
    for (int strip_index = 0; strip_index < strip_count; ++strip_index) {
        const double strip_min_x = box.min_x + strip_index * strip_width;
        const double strip_max_x = strip_index + 1 == strip_count ? box.max_x : box.min_x + (strip_index + 1) * strip_width;
        const Polygon strip{
            Point2D{strip_min_x, box.min_y},
            Point2D{strip_max_x, box.min_y},
            Point2D{strip_max_x, box.max_y},
            Point2D{strip_min_x, box.max_y}
        };

        for (const MultiPolygon& component : geometry::components(geometry::intersection(field_region, MultiPolygon{strip}))) {
            if (geometry::area(component) < min_area_sqm) {
                continue;
            }
            list_pieces.push_back(component.front());
        }
    }
    return list_pieces;
}

}  // namespace crop_survey
