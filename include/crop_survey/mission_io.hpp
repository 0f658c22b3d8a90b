// === Flight Plan Output ======================================================
//
// JSON rendering of planned missions for the flight-execution backend, plus a
// helper that writes a document to disk.

#pragma once

#include <filesystem>

#include <nlohmann/json.hpp>

#include "crop_survey/mission.hpp"

namespace crop_survey {

[[nodiscard]] nlohmann::json mission_to_json(const Mission& mission);

[[nodiscard]] nlohmann::json adaptive_plan_to_json(const AdaptivePlan& plan);

/**
 * @brief Write @p document with two-space indentation.
 *
 * @return The path that was written.
 * @throws std::runtime_error if the file cannot be opened or written.
 */
std::filesystem::path save_flight_plan(const nlohmann::json& document, const std::filesystem::path& output_path);

}  // namespace crop_survey
