/// @file types.hpp
/// @brief Core types for the VM lifecycle

#pragma once

#include "fwd.hpp"

#include <vmwarden/core/error.hpp>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

namespace vmw_vm {

// =============================================================================
// Constants
// =============================================================================

/// Prefix of the first line an SSH-2 server sends
inline constexpr std::string_view kSshBannerPrefix = "SSH-2.0-";

/// Longest reply line read from the guest ssh service
inline constexpr std::size_t kMaxBannerLength = 64 * 1024;

/// QEMU diagnostic printed when the guest RAM cannot be allocated
inline constexpr std::string_view kMemoryFailureMarker = "cannot set up guest memory";

/// QEMU's generic failure exit status
inline constexpr int kGenericFailureExit = 1;

/// Task names inside the lifecycle task group
namespace task_names {
inline constexpr const char* kProcess = "process";
inline constexpr const char* kBootProbe = "boot_probe";
inline constexpr const char* kProgress = "progress";
inline constexpr const char* kBootWatchdog = "boot_watchdog";
inline constexpr const char* kShutdown = "shutdown";
inline constexpr const char* kShutdownWatchdog = "shutdown_watchdog";
} // namespace task_names

// =============================================================================
// Phase
// =============================================================================

/// Lifecycle phase of the supervised VM
enum class Phase : std::uint8_t {
    Off,            ///< No process, or process has exited
    Booting,        ///< Process started, guest not reachable yet
    Running,        ///< Guest answered the boot probe
    ShuttingDown,   ///< Power-down requested
};

[[nodiscard]] const char* to_string(Phase phase);

/// One-character rendering used by the progress reporter
[[nodiscard]] char phase_char(Phase phase);

/// True for Off->Booting, Booting->Running, Running->ShuttingDown and X->Off
[[nodiscard]] bool is_valid_transition(Phase from, Phase to);

// =============================================================================
// Timeouts
// =============================================================================

/// What a watchdog does to the hypervisor when it fires
enum class TimeoutPolicy : std::uint8_t {
    Abandon,    ///< Stop supervising; the process may keep running
    Kill,       ///< SIGKILL the process group and wait for it to exit
};

[[nodiscard]] const char* to_string(TimeoutPolicy policy);
[[nodiscard]] std::optional<TimeoutPolicy> parse_timeout_policy(std::string_view text);

/// Which watchdog fired
enum class TimeoutKind : std::uint8_t {
    None,
    Boot,
    Shutdown,
};

[[nodiscard]] const char* to_string(TimeoutKind kind);

// =============================================================================
// VmSpec
// =============================================================================

/// What to run: disk image and hypervisor settings
struct VmSpec {
    std::filesystem::path disk_image;
    std::string command = "qemu-system-x86_64";
    double mem_gb = 3.0;
    std::uint16_t port = 2222;

    /// Disk image file name without extension
    [[nodiscard]] std::string title() const;
};

/// Program and argument vector for the hypervisor
struct LaunchCommand {
    std::string program;
    std::vector<std::string> args;

    /// Shell-like rendering for logs
    [[nodiscard]] std::string to_string() const;
};

// =============================================================================
// SessionConfig
// =============================================================================

/// Timing and environment of one supervised run
struct SessionConfig {
    using Duration = std::chrono::steady_clock::duration;

    Duration boot_timeout = std::chrono::seconds(300);
    Duration shutdown_timeout = std::chrono::seconds(60);
    Duration probe_interval = std::chrono::seconds(1);
    Duration progress_interval = std::chrono::seconds(1);

    std::filesystem::path log_directory = ".";
    std::filesystem::path control_socket;   ///< Empty: default per-process path
    std::string probe_host = "127.0.0.1";

    bool flush_log = false;
    TimeoutPolicy timeout_policy = TimeoutPolicy::Abandon;

    /// Builder pattern
    SessionConfig& with_boot_timeout(Duration d) { boot_timeout = d; return *this; }
    SessionConfig& with_shutdown_timeout(Duration d) { shutdown_timeout = d; return *this; }
    SessionConfig& with_probe_interval(Duration d) { probe_interval = d; return *this; }
    SessionConfig& with_progress_interval(Duration d) { progress_interval = d; return *this; }
    SessionConfig& with_log_directory(std::filesystem::path p) { log_directory = std::move(p); return *this; }
    SessionConfig& with_control_socket(std::filesystem::path p) { control_socket = std::move(p); return *this; }
    SessionConfig& with_flush_log(bool f) { flush_log = f; return *this; }
    SessionConfig& with_timeout_policy(TimeoutPolicy p) { timeout_policy = p; return *this; }
};

// =============================================================================
// Validation
// =============================================================================

/// Longest boot or shutdown timeout accepted from users
inline constexpr std::chrono::hours kMaxTimeout{24 * 7};

/// Largest guest memory size accepted from users, in GB
inline constexpr double kMaxMemGb = 1024.0 * 1024.0;

/// Convert a user-supplied number of seconds.
/// Returns nullopt unless it is finite, positive and no longer than kMaxTimeout.
[[nodiscard]] std::optional<SessionConfig::Duration> duration_from_seconds(double seconds);

/// True for a finite, positive size no larger than kMaxMemGb
[[nodiscard]] bool valid_mem_gb(double mem_gb);

// =============================================================================
// RunResult
// =============================================================================

/// Outcome of Controller::run()
struct RunResult {
    Phase final_phase = Phase::Off;
    std::optional<pid_t> pid;
    std::optional<int> exit_code;       ///< Negative: killed by that signal
    bool memory_failure = false;
    bool control_established = false;
    TimeoutKind timeout = TimeoutKind::None;
    std::vector<vmw_core::Error> task_errors;
    std::filesystem::path log_path;

    [[nodiscard]] bool succeeded() const { return exit_code && *exit_code == 0; }

    /// Status the whole run should exit with: the process's own status,
    /// 128 + N for death by signal N, 1 when none was obtained
    [[nodiscard]] int process_exit_status() const {
        if (!exit_code) {
            return 1;
        }
        return *exit_code < 0 ? 128 - *exit_code : *exit_code;
    }
};

} // namespace vmw_vm
