/// @file report.hpp
/// @brief User-facing summary of a finished run

#pragma once

#include "types.hpp"

#include <string>
#include <sys/types.h>

namespace vmw_vm {

/// What to tell the user after Controller::run()
struct RunReport {
    bool success = false;
    std::string message;    ///< One paragraph, no surrounding blank lines
    std::string advice;     ///< Remediation text, empty if none
};

/// True if a process with @p pid still exists (zombies included)
[[nodiscard]] bool process_alive(pid_t pid);

/// Build the report for @p result. @p process_still_alive is only consulted
/// when the run produced a pid but no exit status.
[[nodiscard]] RunReport build_report(const RunResult& result, double mem_gb, bool process_still_alive);

} // namespace vmw_vm
