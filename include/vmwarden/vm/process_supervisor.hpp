/// @file process_supervisor.hpp
/// @brief Launches the hypervisor and waits for it to exit
///
/// The supervisor is the only component that moves the session to Off. On
/// every exit path (normal exit, spawn failure, cancellation) it cancels the
/// other lifecycle tasks so none of them can outlive the process.

#pragma once

#include "context.hpp"
#include "types.hpp"

#include <vmwarden/core/error.hpp>
#include <vmwarden/core/unique_fd.hpp>

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>

#include <sys/types.h>

namespace vmw_vm {

/// Failure to start or wait for the hypervisor
class SupervisorError : public vmw_core::ErrorException {
public:
    explicit SupervisorError(vmw_core::ProcessError detail)
        : vmw_core::ErrorException(vmw_core::Error(std::move(detail)))
    {}

    [[nodiscard]] const vmw_core::ProcessError& detail() const {
        return *error().as<vmw_core::ProcessError>();
    }
};

class ProcessSupervisor {
public:
    ProcessSupervisor(LifecycleContext& context, LaunchCommand command);

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    /// Task body: spawn, wait for exit, clean up
    boost::asio::awaitable<void> run(vmw_async::Task& task);

    /// Send @p signal to the hypervisor's process group
    vmw_core::Result<void> kill_process_group(int signal);

    /// True between a successful spawn and the observed exit
    [[nodiscard]] bool running() const;

private:
    boost::asio::awaitable<void> supervise(vmw_async::Task& task);
    pid_t spawn();
    void record_exit(int status);
    [[nodiscard]] bool log_reports_memory_failure() const;
    void cleanup();

    LifecycleContext& m_ctx;
    LaunchCommand m_command;
    vmw_core::UniqueFd m_stdin;
    pid_t m_pid = -1;
    bool m_exited = false;
};

} // namespace vmw_vm
