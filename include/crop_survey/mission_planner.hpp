// === Mission Planner =========================================================
//
// Entry point of the planning core. `plan_grid_mission` runs the single-flight
// pipeline: validation, safe zone, lawnmower sweep, obstacle detours,
// waypoint post-processing and feasibility metadata. `plan_adaptive_mission`
// splits fields that exceed one battery into strips and plans each strip on
// its own.
//
// Both calls are pure functions of their inputs: the planner holds only the
// immutable vehicle profile, so one instance may serve concurrent callers.

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "crop_survey/field_config.hpp"
#include "crop_survey/logging.hpp"
#include "crop_survey/mission.hpp"
#include "crop_survey/vehicle_profile.hpp"

namespace crop_survey {

class MissionPlanner final {
  public:
    explicit MissionPlanner(VehicleProfile profile);

    [[nodiscard]] const VehicleProfile& profile() const noexcept;

    /**
     * @brief Plan a single-flight lawnmower mission over @p field.
     *
     * @param field Field outline, obstacles and no-fly zones.
     * @param altitude_m Flight altitude in metres, must be positive.
     * @param overlap_fraction Side overlap between adjacent images, in [0, 1).
     * @param optimize_for_battery Subsample waypoints to the battery-derived cap.
     * @throws ConfigError on invalid input.
     * @throws GeometryInfeasibleError when obstacles cover the whole field.
     */
    [[nodiscard]] Mission plan_grid_mission(
        const FieldConfig& field,
        double altitude_m,
        double overlap_fraction,
        bool optimize_for_battery
    ) const;

    /**
     * @brief Plan one battery-sized mission per field section.
     *
     * Fields within one battery's coverage estimate are planned whole. Larger
     * fields are cut into vertical strips, and any strip still needing more
     * than one battery is cut again. Fully obstructed strips are skipped.
     *
     * @throws ConfigError on invalid input.
     */
    [[nodiscard]] AdaptivePlan plan_adaptive_mission(
        const FieldConfig& field,
        double altitude_m,
        double overlap_fraction
    ) const;

  private:
    void check_flight_parameters(double altitude_m, double overlap_fraction) const;

    /** @brief Section of @p field bounded by @p section_boundary, keeping only exclusions that reach it. */
    [[nodiscard]] FieldConfig make_section(const FieldConfig& field, const Polygon& section_boundary, std::string section_name) const;

    void plan_section(
        const FieldConfig& section,
        double altitude_m,
        double overlap_fraction,
        int split_depth,
        AdaptivePlan& plan
    ) const;

    VehicleProfile profile_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace crop_survey
