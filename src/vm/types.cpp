/// @file types.cpp
/// @brief VM lifecycle type helpers

#include <vmwarden/vm/types.hpp>

#include <cmath>
#include <sstream>

namespace vmw_vm {

const char* to_string(Phase phase) {
    switch (phase) {
        case Phase::Off: return "off";
        case Phase::Booting: return "booting";
        case Phase::Running: return "running";
        case Phase::ShuttingDown: return "shutting_down";
        default: return "unknown";
    }
}

char phase_char(Phase phase) {
    return to_string(phase)[0];
}

bool is_valid_transition(Phase from, Phase to) {
    if (to == Phase::Off) {
        return true;
    }
    switch (from) {
        case Phase::Off: return to == Phase::Booting;
        case Phase::Booting: return to == Phase::Running;
        case Phase::Running: return to == Phase::ShuttingDown;
        default: return false;
    }
}

const char* to_string(TimeoutPolicy policy) {
    switch (policy) {
        case TimeoutPolicy::Abandon: return "abandon";
        case TimeoutPolicy::Kill: return "kill";
        default: return "unknown";
    }
}

std::optional<TimeoutPolicy> parse_timeout_policy(std::string_view text) {
    if (text == "abandon") return TimeoutPolicy::Abandon;
    if (text == "kill") return TimeoutPolicy::Kill;
    return std::nullopt;
}

const char* to_string(TimeoutKind kind) {
    switch (kind) {
        case TimeoutKind::None: return "none";
        case TimeoutKind::Boot: return "boot";
        case TimeoutKind::Shutdown: return "shutdown";
        default: return "unknown";
    }
}

std::optional<SessionConfig::Duration> duration_from_seconds(double seconds) {
    const double limit = std::chrono::duration<double>(kMaxTimeout).count();
    if (!std::isfinite(seconds) || seconds <= 0.0 || seconds > limit) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<SessionConfig::Duration>(std::chrono::duration<double>(seconds));
}

bool valid_mem_gb(double mem_gb) {
    return std::isfinite(mem_gb) && mem_gb > 0.0 && mem_gb <= kMaxMemGb;
}

std::string VmSpec::title() const {
    return disk_image.stem().string();
}

std::string LaunchCommand::to_string() const {
    std::ostringstream ss;
    ss << program;
    for (const auto& arg : args) {
        ss << ' ';
        if (arg.find_first_of(" \t\"'") != std::string::npos) {
            ss << '"' << arg << '"';
        } else {
            ss << arg;
        }
    }
    return ss.str();
}

} // namespace vmw_vm
