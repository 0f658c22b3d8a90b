// === Planning Errors =========================================================
//
// Exception hierarchy for conditions that abort a planning call. Conditions
// that still yield a usable plan (unsafe detours, battery overrun) are carried
// as warnings on the returned Mission instead.

#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace crop_survey {

/** @brief Base class for every error that aborts planning. */
class PlanningError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

/** @brief Malformed or missing input, reported against a specific field. */
class ConfigError final : public PlanningError {
  public:
    ConfigError(std::string field_name, const std::string& message)
        : PlanningError(field_name + ": " + message),
          str_field_name_(std::move(field_name)) {}

    /** @brief Name of the offending input field. */
    [[nodiscard]] const std::string& field_name() const noexcept {
        return str_field_name_;
    }

  private:
    std::string str_field_name_;
};

/** @brief Obstacles leave no flyable area inside the field. */
class GeometryInfeasibleError final : public PlanningError {
  public:
    using PlanningError::PlanningError;
};

}  // namespace crop_survey
