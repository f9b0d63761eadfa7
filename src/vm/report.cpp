/// @file report.cpp
/// @brief Run report wording

#include <vmwarden/vm/report.hpp>

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <csignal>

namespace vmw_vm {

bool process_alive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    // Signal 0 only checks existence; EPERM still means it exists
    return ::kill(pid, 0) == 0 || errno == EPERM;
}

RunReport build_report(const RunResult& result, double mem_gb, bool process_still_alive) {
    RunReport report;

    if (result.succeeded()) {
        report.success = true;
        report.message = "VM process completed successfully";
        return report;
    }

    const std::string see_log = fmt::format("see {}", result.log_path.string());

    if (!result.exit_code) {
        if (!result.pid) {
            report.message = fmt::format("Failed to start VM process: {}", see_log);
        } else if (!process_still_alive) {
            report.message = fmt::format("VM process died uncleanly: {}", see_log);
        } else {
            report.message = fmt::format(
                "Apparently failed to shut down VM process: {}\n\n"
                "Try logging in with ssh and issuing \"sudo shutdown now\" manually; otherwise\n"
                "kill process {} if it's unresponsive.",
                see_log, *result.pid);
        }
    } else if (*result.exit_code < 0) {
        report.message = fmt::format("VM process killed with signal {}: {}", -*result.exit_code, see_log);
    } else {
        report.message = fmt::format("VM process completed with error status {}: {}",
                                     *result.exit_code, see_log);
    }

    if (result.memory_failure) {
        report.advice = fmt::format(
            "It looks like QEMU failed to allocate {}GB of contiguous memory to run the VM.\n\n"
            "Try restarting large programs such as your Web browser, to reduce memory\n"
            "fragmentation (or closing them entirely if that doesn't solve it). If the\n"
            "problem persists, try reducing \"mem\" in the configuration (without going\n"
            "below 0.25 to 0.5GB, for acceptable performance with a minimal installation).",
            mem_gb);
    }

    return report;
}

} // namespace vmw_vm
