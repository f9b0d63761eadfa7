#pragma once

/// @file version.hpp
/// @brief vmwarden release version

namespace vmwarden {

inline constexpr const char* kVersionString = "0.1.0";

} // namespace vmwarden
