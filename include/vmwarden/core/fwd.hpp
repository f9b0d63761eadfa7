#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for vmw_core module

#include <cstdint>

namespace vmw_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
class Error;

template<typename T, typename E = Error>
class Result;

struct ProcessError;
struct ProtocolError;
struct ConfigError;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class SessionLog;

} // namespace vmw_core
