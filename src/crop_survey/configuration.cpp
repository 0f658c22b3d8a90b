// === Configuration Loader ====================================================
//
// Centralizes parsing and validation of environment-driven settings that feed
// the planner executable. Raw environment variables are turned into the
// strongly-typed `Configuration` structure consumed by `MissionPlanner`.
//
// Values that cannot be parsed, or fall outside their valid range, are logged
// and replaced by the default. This file never reads from disk; field
// definitions arrive through `load_field_config` instead.

#include "crop_survey/configuration.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>
#include <string_view>

#include "crop_survey/logging.hpp"

namespace crop_survey {

namespace {
constexpr std::string_view k_default_log_directory{"logs"};

double clamp_positive(double value, double fallback) {
    if (value <= 0.0) {
        return fallback;
    }
    return value;
}

double parse_double(const char* raw_value, double fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        return clamp_positive(parsed_value, fallback);
    } catch (const std::exception&) {
        auto logger = get_logger();
        logger->warn("Failed to parse double from environment; using fallback {}", fallback);
        return fallback;
    }
}

double parse_overlap(const char* raw_value, double fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    try {
        const double parsed_value = std::stod(raw_value);
        if (parsed_value < 0.0 || parsed_value >= 1.0) {
            get_logger()->warn("Overlap {} outside [0, 1); using fallback {}", parsed_value, fallback);
            return fallback;
        }
        return parsed_value;
    } catch (const std::exception&) {
        get_logger()->warn("Failed to parse overlap from environment; using fallback {}", fallback);
        return fallback;
    }
}

bool parse_bool(const char* raw_value, bool fallback) {
    if (raw_value == nullptr) {
        return fallback;
    }
    std::string str_value{raw_value};
    std::transform(str_value.begin(), str_value.end(), str_value.begin(), [](unsigned char character) {
        return static_cast<char>(std::tolower(character));
    });
    if (str_value == "1" || str_value == "true" || str_value == "yes" || str_value == "on") {
        return true;
    }
    if (str_value == "0" || str_value == "false" || str_value == "no" || str_value == "off") {
        return false;
    }
    get_logger()->warn("Failed to parse boolean '{}' from environment; using fallback {}", str_value, fallback);
    return fallback;
}

std::string parse_log_directory() {
    const char* raw_directory = std::getenv("CROP_SURVEY_LOG_DIR");
    if (raw_directory == nullptr || std::string_view{raw_directory}.empty()) {
        return std::string{k_default_log_directory};
    }
    return std::string{raw_directory};
}

}  // namespace

Configuration ConfigurationLoader::load() {
    Configuration config{};
    config.log_directory = parse_log_directory();

    auto logger = initialize_logger(config.log_directory);
    logger->info("Loading configuration from environment");

    const PlanningConfig defaults{};
    config.planning.altitude_m = parse_double(std::getenv("CROP_SURVEY_ALTITUDE_M"), defaults.altitude_m);
    config.planning.overlap_fraction = parse_overlap(std::getenv("CROP_SURVEY_OVERLAP"), defaults.overlap_fraction);
    config.planning.optimize_for_battery = parse_bool(std::getenv("CROP_SURVEY_OPTIMIZE_FOR_BATTERY"), defaults.optimize_for_battery);
    config.vehicle = load_vehicle_profile();

    logger->info("Configuration loaded: altitude_m={} overlap={} optimize_for_battery={} usable_flight_time_sec={}",
                 config.planning.altitude_m,
                 config.planning.overlap_fraction,
                 config.planning.optimize_for_battery,
                 config.vehicle.usable_flight_time_sec());

    return config;
}

VehicleProfile ConfigurationLoader::load_vehicle_profile() {
    const VehicleProfile defaults{};

    FlightEnvelope envelope = defaults.envelope();
    envelope.max_range_m = parse_double(std::getenv("CROP_SURVEY_MAX_RANGE_M"), envelope.max_range_m);

    BatteryModel battery = defaults.battery();
    battery.battery_life_min = parse_double(std::getenv("CROP_SURVEY_BATTERY_LIFE_MIN"), battery.battery_life_min);

    MissionTiming timing = defaults.timing();
    timing.cruise_speed_mps = parse_double(std::getenv("CROP_SURVEY_CRUISE_SPEED_MPS"), timing.cruise_speed_mps);

    try {
        return VehicleProfile{defaults.camera(), envelope, battery, timing, defaults.tolerances()};
    } catch (const std::invalid_argument& exc) {
        get_logger()->warn("Rejected vehicle overrides from environment ({}); using default profile", exc.what());
        return defaults;
    }
}

}  // namespace crop_survey
