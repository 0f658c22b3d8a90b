// === Vehicle Profile =========================================================
//
// Immutable description of the survey quadcopter: camera optics, flight
// envelope, battery budget and the timing constants used to estimate mission
// duration. A profile is built once per process and shared read-only by every
// planning call.

#pragma once

namespace crop_survey {

/**
 * @brief Camera optics that determine the ground footprint.
 */
struct CameraModel final {
    double horizontal_fov_deg{82.6}; /**< Horizontal field of view in degrees. */
    double vertical_fov_deg{51.0};   /**< Vertical field of view in degrees. */
};

/**
 * @brief Describes the safe operating limits for the airframe.
 */
struct FlightEnvelope final {
    double min_altitude_m{0.5};     /**< Lowest safe altitude above the crop in metres. */
    double max_altitude_m{3.0};     /**< Highest altitude that still yields useful crop detail. */
    double max_speed_mps{2.0};      /**< Conservative horizontal speed in m/s. */
    double max_range_m{80.0};       /**< Communication range limit in metres. */
    int min_move_cm{20};            /**< Shortest reliable single move command. */
    int max_move_cm{500};           /**< Longest accepted single move command. */
    int position_drift_cm{50};      /**< Expected cumulative position drift. */
};

/**
 * @brief Battery capacity expressed as flight time.
 */
struct BatteryModel final {
    double battery_life_min{30.0};   /**< Total flight time on a full battery in minutes. */
    double reserve_fraction{0.20};   /**< Fraction of flight time held back for landing. */
};

/**
 * @brief Calibration constants for duration, capacity and routing estimates.
 */
struct MissionTiming final {
    double cruise_speed_mps{2.0};             /**< Average speed assumed between waypoints. */
    double hover_sec_per_waypoint{1.0};       /**< Hover time spent at every waypoint. */
    double takeoff_landing_sec{6.0};          /**< Fixed takeoff plus landing overhead. */
    double coverage_hover_budget_sec{40.0};   /**< Hover allowance used by the coverage pre-check. */
    double capacity_sec_per_waypoint{2.0};    /**< Move plus hover cost used to cap waypoint count. */
    double capacity_overhead_sec{10.0};       /**< Overhead subtracted before capping waypoints. */
    double capacity_safety_margin{0.9};       /**< Fraction of the waypoint cap actually used. */
    double battery_warning_pct{80.0};         /**< Battery usage above which a soft warning is raised. */
};

/**
 * @brief Clearances and thresholds applied by the geometric stages.
 */
struct PlanningTolerances final {
    double obstacle_buffer_m{2.0};     /**< Clearance added around obstacles and no-fly zones. */
    double detour_buffer_m{0.5};       /**< Extra margin around the blocking bounding box for detours. */
    int duplicate_threshold_cm{30};    /**< Planar distance below which consecutive waypoints merge. */
    double min_strip_area_sqm{1.0};    /**< Strip intersections smaller than this are discarded. */
};

/**
 * @brief Complete, validated profile of the survey vehicle.
 */
class VehicleProfile final {
  public:
    /** @brief Profile of the default Tello-class survey drone. */
    VehicleProfile();

    /**
     * @throws std::invalid_argument for non-physical constants, or a battery
     *         budget that cannot cover takeoff, landing and two waypoints.
     */
    VehicleProfile(
        CameraModel camera,
        FlightEnvelope envelope,
        BatteryModel battery,
        MissionTiming timing,
        PlanningTolerances tolerances
    );

    [[nodiscard]] const CameraModel& camera() const noexcept;
    [[nodiscard]] const FlightEnvelope& envelope() const noexcept;
    [[nodiscard]] const BatteryModel& battery() const noexcept;
    [[nodiscard]] const MissionTiming& timing() const noexcept;
    [[nodiscard]] const PlanningTolerances& tolerances() const noexcept;

    /** @brief Flight time left after the battery reserve, whole seconds. */
    [[nodiscard]] int usable_flight_time_sec() const noexcept;

  private:
    void validate() const;

    CameraModel camera_;
    FlightEnvelope envelope_;
    BatteryModel battery_;
    MissionTiming timing_;
    PlanningTolerances tolerances_;
};

}  // namespace crop_survey
