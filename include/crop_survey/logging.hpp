#pragma once

#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace crop_survey {

/**
 * @brief Create the process-wide `crop_survey` logger once.
 *
 * Writes to the console and to `<log_directory>/crop_survey.log` as JSON
 * lines. Later calls return the existing logger.
 */
std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory);

/** @brief The planner logger, or spdlog's default logger before initialization. */
std::shared_ptr<spdlog::logger> get_logger();

void set_log_level(const std::string& str_level);

}  // namespace crop_survey
