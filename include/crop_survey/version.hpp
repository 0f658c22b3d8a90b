// === Version Metadata ========================================================
//
// Exposes the planner's semantic version string used in logs and flight plans.

#pragma once

#include <string_view>

namespace crop_survey {

inline constexpr std::string_view k_version{"2.0.0"};

}  // namespace crop_survey
