// === Field Configuration =====================================================
//
// Describes a surveyed field: its boundary, the obstacles and no-fly zones
// inside it, and an optional georeference passed through untouched. Field
// files are JSON documents; parsing and structural validation both report
// problems as ConfigError naming the offending key.

#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "crop_survey/types.hpp"

namespace crop_survey {

/** @brief Fixed obstacle such as a tree or building. */
struct Obstacle final {
    std::string kind{};   /**< Free-form obstacle category, e.g. "tree". */
    Polygon boundary{};   /**< Footprint of the obstacle in field coordinates. */
};

/** @brief Complete description of one field to survey. */
struct FieldConfig final {
    std::string field_id{};                 /**< Opaque identifier echoed into every mission. */
    std::string name{};                     /**< Display name. */
    Polygon boundary{};                     /**< Field outline in metres. */
    std::vector<Obstacle> obstacles{};      /**< Physical obstacles to keep clear of. */
    std::vector<Polygon> no_fly_zones{};    /**< Regulatory or owner-imposed exclusion areas. */
    OptionalGeoreference reference_point{}; /**< Satellite alignment anchor, not interpreted. */
};

/**
 * @brief Normalize rings and reject degenerate or self-intersecting polygons.
 *
 * @throws ConfigError naming the first invalid field.
 */
[[nodiscard]] FieldConfig validated_field_config(FieldConfig config);

/** @brief Obstacle and no-fly polygons in one list, obstacles first. */
[[nodiscard]] std::vector<Polygon> exclusion_polygons(const FieldConfig& config);

[[nodiscard]] FieldConfig field_config_from_json(const nlohmann::json& document);

/** @brief Read and validate a field configuration file. */
[[nodiscard]] FieldConfig load_field_config(const std::filesystem::path& config_path);

}  // namespace crop_survey
