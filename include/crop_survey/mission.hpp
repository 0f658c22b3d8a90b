// === Mission =================================================================
//
// Result types returned to callers: a single-battery grid mission and the
// multi-flight plan produced in adaptive mode. Both are plain values created
// fresh per planning call.

#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "crop_survey/field_validator.hpp"
#include "crop_survey/types.hpp"

namespace crop_survey {

/**
 * @brief Ordered waypoint sequence plus feasibility metadata for one flight.
 *
 * Waypoint order is flight order. `is_feasible` always equals
 * `estimated_battery_pct <= 100`; obstacle safety is reported separately
 * through `unsafe_segments` and `routing_warnings`.
 */
struct Mission final {
    std::string field_id{};                    /**< Echo of the field identifier. */
    std::string field_name{};                  /**< Field or section display name. */
    std::vector<Waypoint> waypoints{};         /**< Flight order, centimetres. */
    int altitude_cm{};                         /**< Requested flight altitude. */
    double overlap_fraction{};                 /**< Requested image overlap. */
    int total_waypoints{};                     /**< Size of `waypoints`. */
    int estimated_duration_sec{};              /**< Cruise, hover and takeoff/landing time. */
    int estimated_battery_pct{};               /**< Share of the usable flight time. */
    int batteries_needed{};                    /**< Battery cycles required. */
    double total_distance_m{};                 /**< 3D path length. */
    double coverage_area_sqm{};                /**< Area of the flyable safe zone. */
    ValidationResult validation{};             /**< Advisory field checks. */
    bool is_feasible{};                        /**< Fits on a single battery. */
    std::vector<std::string> warnings{};       /**< Battery soft and hard warnings. */
    std::vector<std::string> routing_warnings{}; /**< One entry per hop left crossing an obstacle. */
    std::vector<std::size_t> unsafe_segments{};  /**< Indices i of unsafe hops waypoints[i]→waypoints[i+1]. */
    OptionalGeoreference reference_point{};    /**< Passed through from the field config. */
};

/** @brief Battery-sized sections of one field, each flown as its own mission. */
struct AdaptivePlan final {
    std::string field_id{};
    std::string field_name{};
    double total_area_sqm{};              /**< Area of the whole field boundary. */
    bool multi_flight{};                  /**< True when the field was split. */
    std::vector<Mission> missions{};      /**< One mission per section; no ordering between them. */
    std::vector<std::string> warnings{};  /**< Sections skipped or left infeasible. */
};

}  // namespace crop_survey
