#include "crop_survey/field_config.hpp"

#include <cmath>
#include <fstream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

#include "crop_survey/errors.hpp"
#include "crop_survey/geometry.hpp"
#include "crop_survey/logging.hpp"

namespace crop_survey {

namespace {

constexpr double k_min_polygon_area_sqm{1e-6}; /**< Areas at or below this count as degenerate. */

Polygon validated_ring(Polygon ring, const std::string& field_name) {
    if (ring.empty()) {
        throw ConfigError(field_name, "polygon has no vertices");
    }
    Polygon normalized_ring = geometry::normalized(std::move(ring));
    if (normalized_ring.size() < 3) {
        throw ConfigError(field_name, "polygon needs at least three distinct vertices");
    }
    if (std::abs(geometry::signed_area(normalized_ring)) <= k_min_polygon_area_sqm) {
        throw ConfigError(field_name, "polygon has zero area");
    }
    if (!geometry::is_simple(normalized_ring)) {
        throw ConfigError(field_name, "polygon is self-intersecting");
    }
    return normalized_ring;
}

Polygon parse_ring(const nlohmann::json& node, const std::string& field_name) {
    if (!node.is_array()) {
        throw ConfigError(field_name, "expected an array of [x, y] pairs");
    }
    Polygon ring;
    ring.reserve(node.size());
    for (const nlohmann::json& vertex : node) {
        if (!vertex.is_array() || vertex.size() < 2 || !vertex[0].is_number() || !vertex[1].is_number()) {
            throw ConfigError(field_name, "expected an array of [x, y] pairs");
        }
        ring.push_back(Point2D{vertex[0].get<double>(), vertex[1].get<double>()});
    }
    return ring;
}

std::string optional_string(const nlohmann::json& document, const char* key) {
    const auto iterator_value = document.find(key);
    if (iterator_value == document.end() || iterator_value->is_null()) {
        return {};
    }
    if (iterator_value->is_string()) {
        return iterator_value->get<std::string>();
    }
    return iterator_value->dump();
}

double optional_coordinate(const nlohmann::json& reference, const char* key) {
    const auto iterator_value = reference.find(key);
    if (iterator_value == reference.end()) {
        return 0.0;
    }
    if (!iterator_value->is_number()) {
        throw ConfigError(fmt::format("reference_point.{}", key), "expected a number");
    }
    return iterator_value->get<double>();
}

}  // namespace

FieldConfig validated_field_config(FieldConfig config) {
    config.boundary = validated_ring(std::move(config.boundary), "boundary");
    for (std::size_t index = 0; index < config.obstacles.size(); ++index) {
        config.obstacles[index].boundary = validated_ring(
            std::move(config.obstacles[index].boundary),
            fmt::format("obstacles[{}].boundary", index)
        );
    }
    for (std::size_t index = 0; index < config.no_fly_zones.size(); ++index) {
        config.no_fly_zones[index] = validated_ring(
            std::move(config.no_fly_zones[index]),
            fmt::format("no_fly_zones[{}]", index)
        );
    }
    return config;
}

std::vector<Polygon> exclusion_polygons(const FieldConfig& config) {
    std::vector<Polygon> list_polygons;
    list_polygons.reserve(config.obstacles.size() + config.no_fly_zones.size());
    for (const Obstacle& obstacle : config.obstacles) {
        list_polygons.push_back(obstacle.boundary);
    }
    for (const Polygon& zone : config.no_fly_zones) {
        list_polygons.push_back(zone);
    }
    return list_polygons;
}

FieldConfig field_config_from_json(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw ConfigError("field_config", "expected a JSON object");
    }

    FieldConfig config{};
    config.field_id = optional_string(document, "field_id");
    config.name = optional_string(document, "name");

    const auto iterator_boundary = document.find("boundary");
    if (iterator_boundary == document.end()) {
        throw ConfigError("boundary", "no field boundary defined");
    }
    config.boundary = parse_ring(*iterator_boundary, "boundary");

    if (const auto iterator_obstacles = document.find("obstacles"); iterator_obstacles != document.end()) {
        if (!iterator_obstacles->is_array()) {
            throw ConfigError("obstacles", "expected an array of obstacles");
        }
        for (std::size_t index = 0; index < iterator_obstacles->size(); ++index) {
            const nlohmann::json& node = (*iterator_obstacles)[index];
            if (!node.is_object() || !node.contains("boundary")) {
                throw ConfigError(fmt::format("obstacles[{}]", index), "obstacle requires a boundary");
            }
            Obstacle obstacle{};
            obstacle.kind = optional_string(node, "type");
            obstacle.boundary = parse_ring(node.at("boundary"), fmt::format("obstacles[{}].boundary", index));
            config.obstacles.push_back(std::move(obstacle));
        }
    }

    if (const auto iterator_zones = document.find("no_fly_zones"); iterator_zones != document.end()) {
        if (!iterator_zones->is_array()) {
            throw ConfigError("no_fly_zones", "expected an array of polygons");
        }
        for (std::size_t index = 0; index < iterator_zones->size(); ++index) {
            const nlohmann::json& node = (*iterator_zones)[index];
            const std::string field_name = fmt::format("no_fly_zones[{}]", index);
            if (node.is_object()) {
                if (!node.contains("boundary")) {
                    throw ConfigError(field_name, "no-fly zone requires a boundary");
                }
                config.no_fly_zones.push_back(parse_ring(node.at("boundary"), field_name));
            } else {
                config.no_fly_zones.push_back(parse_ring(node, field_name));
            }
        }
    }

    if (const auto iterator_reference = document.find("reference_point");
        iterator_reference != document.end() && !iterator_reference->is_null()) {
        if (!iterator_reference->is_object()) {
            throw ConfigError("reference_point", "expected an object with numeric lat and lon");
        }
        Georeference reference{};
        reference.latitude_deg = optional_coordinate(*iterator_reference, "lat");
        reference.longitude_deg = optional_coordinate(*iterator_reference, "lon");
        config.reference_point = reference;
    }

    return validated_field_config(std::move(config));
}

FieldConfig load_field_config(const std::filesystem::path& config_path) {
    std::ifstream stream(config_path);
    if (!stream.is_open()) {
        throw ConfigError(config_path.string(), "unable to open field configuration");
    }

    nlohmann::json document;
    try {
        stream >> document;
    } catch (const nlohmann::json::parse_error& exc) {
        throw ConfigError(config_path.string(), exc.what());
    }

    FieldConfig config = field_config_from_json(document);
    auto logger = get_logger();
    logger->info("Loaded field config: {}", config.name.empty() ? "Unknown" : config.name);
    return config;
}

}  // namespace crop_survey
