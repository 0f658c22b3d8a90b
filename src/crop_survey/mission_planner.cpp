#include "crop_survey/mission_planner.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

#include <fmt/format.h>

#include "crop_survey/errors.hpp"
#include "crop_survey/field_splitter.hpp"
#include "crop_survey/field_validator.hpp"
#include "crop_survey/footprint.hpp"
#include "crop_survey/geometry.hpp"
#include "crop_survey/grid_sweep.hpp"
#include "crop_survey/mission_metadata.hpp"
#include "crop_survey/obstacle_router.hpp"
#include "crop_survey/safe_zone.hpp"
#include "crop_survey/waypoint_processor.hpp"

namespace crop_survey {

namespace {
constexpr int k_max_split_depth{4};          /**< Re-splits allowed for a strip that still overruns one battery. */
constexpr double k_percent_full{100.0};
constexpr double k_cm_per_m{100.0};
constexpr char k_default_field_name[] = "Field";
}  // namespace

MissionPlanner::MissionPlanner(VehicleProfile profile)
    : profile_(std::move(profile)),
      logger_(get_logger()) {}

const VehicleProfile& MissionPlanner::profile() const noexcept {
    return profile_;
}

Mission MissionPlanner::plan_grid_mission(
    const FieldConfig& field,
    double altitude_m,
    double overlap_fraction,
    bool optimize_for_battery
) const {
    check_flight_parameters(altitude_m, overlap_fraction);
    const FieldConfig config = validated_field_config(field);

    Mission mission{};
    mission.field_id = config.field_id;
    mission.field_name = config.name;
    mission.reference_point = config.reference_point;
    mission.altitude_cm = static_cast<int>(std::lround(altitude_m * k_cm_per_m));
    mission.overlap_fraction = overlap_fraction;

    mission.validation = validate_field_size(config.boundary, profile_, altitude_m, overlap_fraction);
    for (const std::string& warning : mission.validation.warnings) {
        logger_->warn("Field {}: {}", config.name, warning);
    }

    const PlanningTolerances& tolerances = profile_.tolerances();
    const SafeZone safe_zone = build_safe_zone(config.boundary, exclusion_polygons(config), tolerances.obstacle_buffer_m);
    mission.coverage_area_sqm = safe_zone.area_sqm;

    const CameraFootprint footprint = camera_footprint(profile_, altitude_m);
    const double spacing_m = track_spacing(profile_, altitude_m, overlap_fraction);
    logger_->info(
        "Grid parameters: altitude {}m, footprint {:.2f}m x {:.2f}m, spacing {:.2f}m (overlap {:.0f}%)",
        altitude_m,
        footprint.width_m,
        footprint.height_m,
        spacing_m,
        overlap_fraction * k_percent_full
    );

    const std::vector<SweepPoint> sweep = generate_sweep(safe_zone.region, spacing_m, altitude_m);
    const ObstacleRouter router(safe_zone.buffered_obstacles, tolerances.detour_buffer_m);
    const RoutingResult routing = router.route(sweep, altitude_m);
    logger_->debug("Sweep produced {} points; {} detours inserted, {} hops unrouted", sweep.size(), routing.detour_count, routing.unrouted_count);

    std::vector<Waypoint> waypoints = remove_duplicate_waypoints(routing.waypoints, tolerances.duplicate_threshold_cm);
    if (optimize_for_battery) {
        const int max_waypoints = calculate_max_waypoints(profile_);
        if (static_cast<int>(waypoints.size()) > max_waypoints) {
            logger_->warn("Limiting waypoints to {} (battery constraint); had {}", max_waypoints, waypoints.size());
            waypoints = subsample_waypoints(waypoints, max_waypoints);
        }
    }

    mission.unsafe_segments = router.unsafe_segments(waypoints);
    for (const std::size_t index : mission.unsafe_segments) {
        const Waypoint& from = waypoints[index];
        const Waypoint& to = waypoints[index + 1];
        mission.routing_warnings.push_back(fmt::format(
            "Segment {} from ({}, {}) to ({}, {}) cm crosses a buffered obstacle; no safe detour was found",
            index,
            from.x_cm,
            from.y_cm,
            to.x_cm,
            to.y_cm
        ));
    }
    if (!mission.unsafe_segments.empty()) {
        logger_->warn("Mission for {} keeps {} segments crossing obstacles", config.name, mission.unsafe_segments.size());
    }

    const MissionMetadata metadata = calculate_mission_metadata(waypoints, profile_);
    mission.total_waypoints = static_cast<int>(waypoints.size());
    mission.waypoints = std::move(waypoints);
    mission.estimated_duration_sec = metadata.duration_sec;
    mission.estimated_battery_pct = metadata.battery_pct;
    mission.batteries_needed = metadata.batteries_needed;
    mission.total_distance_m = metadata.distance_m;
    mission.is_feasible = metadata.battery_pct <= static_cast<int>(k_percent_full);

    if (!mission.is_feasible) {
        mission.warnings.push_back(fmt::format(
            "Mission requires {}% battery ({} batteries, {}min {}s); reduce obstacles or field size",
            metadata.battery_pct,
            metadata.batteries_needed,
            metadata.duration_sec / 60,
            metadata.duration_sec % 60
        ));
    } else if (metadata.battery_pct > profile_.timing().battery_warning_pct) {
        mission.warnings.push_back(fmt::format(
            "Estimated battery usage is {}%; consider reducing complexity",
            metadata.battery_pct
        ));
    }
    for (const std::string& warning : mission.warnings) {
        logger_->warn("{}", warning);
    }

    logger_->info(
        "Planned {}: {} waypoints, {:.2f} m, {} s, {}% battery",
        config.name,
        mission.total_waypoints,
        mission.total_distance_m,
        mission.estimated_duration_sec,
        mission.estimated_battery_pct
    );
    return mission;
}

AdaptivePlan MissionPlanner::plan_adaptive_mission(
    const FieldConfig& field,
    double altitude_m,
    double overlap_fraction
) const {
    check_flight_parameters(altitude_m, overlap_fraction);
    const FieldConfig config = validated_field_config(field);

    AdaptivePlan plan{};
    plan.field_id = config.field_id;
    plan.field_name = config.name;
    plan.total_area_sqm = std::abs(geometry::signed_area(config.boundary));

    const double max_coverage = max_coverage_per_cycle(profile_, altitude_m, overlap_fraction);
    if (plan.total_area_sqm <= max_coverage) {
        plan_section(config, altitude_m, overlap_fraction, 0, plan);
    } else {
        const auto section_count = static_cast<int>(std::ceil(plan.total_area_sqm / max_coverage));
        logger_->info(
            "Field requires {} flights (area {:.0f}m², max per flight {:.0f}m²)",
            section_count,
            plan.total_area_sqm,
            max_coverage
        );

        const std::string base_name = config.name.empty() ? std::string{k_default_field_name} : config.name;
        const std::vector<Polygon> list_pieces = split_into_strips(config.boundary, section_count, profile_.tolerances().min_strip_area_sqm);
        for (std::size_t index = 0; index < list_pieces.size(); ++index) {
            const FieldConfig section = make_section(config, list_pieces[index], fmt::format("{} - Section {}", base_name, index + 1));
            plan_section(section, altitude_m, overlap_fraction, 0, plan);
        }
    }

    plan.multi_flight = plan.missions.size() > 1;
    logger_->info("Adaptive plan for {}: {} flights", config.name, plan.missions.size());
    return plan;
}

void MissionPlanner::check_flight_parameters(double altitude_m, double overlap_fraction) const {
    if (!(altitude_m > 0.0)) {
        throw ConfigError("altitude_m", fmt::format("altitude must be positive, got {}", altitude_m));
    }
    if (!(overlap_fraction >= 0.0 && overlap_fraction < 1.0)) {
        throw ConfigError("overlap_fraction", fmt::format("overlap must lie in [0, 1), got {}", overlap_fraction));
    }
}

FieldConfig MissionPlanner::make_section(const FieldConfig& field, const Polygon& section_boundary, std::string section_name) const {
    FieldConfig section{};
    section.field_id = field.field_id;
    section.name = std::move(section_name);
    section.boundary = section_boundary;
    section.reference_point = field.reference_point;

    const MultiPolygon section_region{section_boundary};
    const double buffer_m = profile_.tolerances().obstacle_buffer_m;
    const auto reaches_section = [&section_region, buffer_m](const Polygon& exclusion) {
        const MultiPolygon buffered = geometry::buffer(MultiPolygon{exclusion}, buffer_m);
        return geometry::area(geometry::intersection(buffered, section_region)) > 0.0;
    };

    for (const Obstacle& obstacle : field.obstacles) {
        if (reaches_section(obstacle.boundary)) {
            section.obstacles.push_back(obstacle);
        }
    }
    for (const Polygon& zone : field.no_fly_zones) {
        if (reaches_section(zone)) {
            section.no_fly_zones.push_back(zone);
        }
    }
    return section;
}

void MissionPlanner::plan_section(
    const FieldConfig& section,
    double altitude_m,
    double overlap_fraction,
    int split_depth,
    AdaptivePlan& plan
) const {
    Mission mission{};
    try {
        mission = plan_grid_mission(section, altitude_m, overlap_fraction, true);
    } catch (const GeometryInfeasibleError& exc) {
        plan.warnings.push_back(fmt::format("{} skipped: {}", section.name, exc.what()));
        logger_->warn("{} skipped: {}", section.name, exc.what());
        return;
    }

    if (mission.is_feasible || split_depth >= k_max_split_depth) {
        if (!mission.is_feasible) {
            plan.warnings.push_back(fmt::format("{} still needs {} batteries", section.name, mission.batteries_needed));
        }
        plan.missions.push_back(std::move(mission));
        return;
    }

    const int sub_count = std::max(2, mission.batteries_needed);
    logger_->info("{} needs {} batteries; splitting into {} strips", section.name, mission.batteries_needed, sub_count);
    const std::string base_name = section.name.empty() ? std::string{k_default_field_name} : section.name;
    const std::vector<Polygon> list_pieces = split_into_strips(section.boundary, sub_count, profile_.tolerances().min_strip_area_sqm);
    for (std::size_t index = 0; index < list_pieces.size(); ++index) {
        const FieldConfig sub_section = make_section(section, list_pieces[index], fmt::format("{}.{}", base_name, index + 1));
        plan_section(sub_section, altitude_m, overlap_fraction, split_depth + 1, plan);
    }
}

}  // namespace crop_survey
