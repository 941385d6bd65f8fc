// === Version Metadata ========================================================
//
// Exposes the library's semantic version string used in logs.

#pragma once

#include <string_view>

namespace transit_presence {

inline constexpr std::string_view k_version{"0.1.0"};

}  // namespace transit_presence
