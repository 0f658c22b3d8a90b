#pragma once

#include "crop_survey/logging.hpp"

#include <filesystem>
#include <memory>

namespace crop_survey::test {

inline void ensure_logger_initialized() {
    static const std::shared_ptr<spdlog::logger> logger_handle = []() {
        const auto log_dir = std::filesystem::temp_directory_path() / "crop_survey_tests_logs";
        return crop_survey::initialize_logger(log_dir.string());
    }();
    (void)logger_handle;
}

}  // namespace crop_survey::test
