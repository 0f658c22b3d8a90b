// === Configuration ===========================================================
//
// Exposes strongly-typed configuration objects that describe the planning
// defaults, vehicle profile and logging destination used by the planner
// executable. `ConfigurationLoader` translates environment variables into
// these structures so downstream modules never touch `std::getenv` directly.

#pragma once

#include <string>

#include "crop_survey/vehicle_profile.hpp"

namespace crop_survey {

/** @brief Defaults applied to every planning call made by the executable. */
struct PlanningConfig final {
    double altitude_m{2.0};             /**< Flight altitude in metres. */
    double overlap_fraction{0.3};       /**< Side overlap between adjacent tracks. */
    bool optimize_for_battery{true};    /**< Cap waypoint count to one battery. */
};

/**
 * @brief Immutable bundle of runtime knobs for the planner.
 *
 * Every field is populated by ConfigurationLoader; consumers should treat the
 * values as authoritative and avoid consulting environment variables directly.
 */
struct Configuration final {
    std::string log_directory{};     /**< Destination directory for structured logs. */
    PlanningConfig planning{};       /**< Altitude, overlap and battery optimisation. */
    VehicleProfile vehicle{};        /**< Airframe profile with environment overrides. */
};

/**
 * @brief Utility responsible for hydrating Configuration from environment
 *        variables.
 */
class ConfigurationLoader final {
  public:
    static Configuration load();

  private:
    static VehicleProfile load_vehicle_profile();
};

}  // namespace crop_survey
