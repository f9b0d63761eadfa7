#pragma once

/// @file log.hpp
/// @brief Logging utilities for vmwarden
///
/// Diagnostic logging goes through named spdlog loggers writing to stderr.
/// The per-VM session log file is a separate concern, see session_log.hpp.

#include <spdlog/spdlog.h>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace vmw_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Configuration for the diagnostic logging system
struct LogConfig {
    bool console_enabled = true;
    spdlog::level::level_enum level = spdlog::level::warn;
};

/// @brief Initialize the logging system with defaults
void init_logging();

/// Configure logging system with full options
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Logger for core utilities and the task substrate
std::shared_ptr<spdlog::logger> core_logger();

/// Logger for VM lifecycle components
std::shared_ptr<spdlog::logger> vm_logger();

/// Logger for the control-socket client
std::shared_ptr<spdlog::logger> qmp_logger();

// =============================================================================
// Log Level Management
// =============================================================================

/// Set global log level
void set_global_log_level(spdlog::level::level_enum level);

/// Get current global log level
spdlog::level::level_enum get_global_log_level();

/// Parse log level from string
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

/// Get log level name
const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Helpers
// =============================================================================

/// Render raw bytes as a quoted, printable string (non-printables escaped)
std::string escape_bytes(std::string_view bytes);

/// Flush all loggers
void flush_all_loggers();

/// Shutdown logging system
void shutdown_logging();

} // namespace vmw_core
