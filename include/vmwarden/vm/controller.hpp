/// @file controller.hpp
/// @brief Lifecycle controller: runs one VM session to completion
///
/// The controller owns the event loop, the session state, the session log
/// and the shutdown-request event. run() starts the six lifecycle tasks in
/// one TaskGroup and returns once all of them have finished, whatever their
/// outcome:
///
/// | task              | role                                           |
/// |-------------------|------------------------------------------------|
/// | process           | spawn hypervisor, wait for exit, set Off       |
/// | boot_probe        | poll guest ssh, Booting -> Running             |
/// | progress          | phase heartbeat                                |
/// | boot_watchdog     | boot timeout                                   |
/// | shutdown          | QMP negotiation, Running -> ShuttingDown       |
/// | shutdown_watchdog | shutdown timeout                               |

#pragma once

#include "context.hpp"
#include "session.hpp"
#include "types.hpp"

#include <vmwarden/async/event.hpp>
#include <vmwarden/async/task.hpp>
#include <vmwarden/core/error.hpp>
#include <vmwarden/core/session_log.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <filesystem>
#include <iosfwd>
#include <memory>
#include <optional>

namespace vmw_vm {

class Controller {
public:
    using PhaseCallback = VmSession::PhaseCallback;
    using TaskEventCallback = vmw_async::TaskGroup::EventCallback;

    explicit Controller(VmSpec spec, SessionConfig config = {});
    ~Controller();

    Controller(const Controller&) = delete;
    Controller& operator=(const Controller&) = delete;

    // =========================================================================
    // Setup (before run)
    // =========================================================================

    /// Redirect progress output and user diagnostics (default: stdout, stderr)
    void set_output(std::ostream& out, std::ostream& err);

    void set_on_phase_change(PhaseCallback callback);
    void set_on_task_event(TaskEventCallback callback);

    /// Run @p command instead of the QEMU invocation built from the VmSpec
    void set_launch_command(LaunchCommand command);

    // =========================================================================
    // Execution
    // =========================================================================

    /// Supervise the VM until every lifecycle task has finished.
    /// Fails only if the session cannot be set up (log not writable) or run()
    /// was already called.
    vmw_core::Result<RunResult> run();

    /// Raise the shutdown-request event (same effect as SIGINT; idempotent).
    /// Must be called from the controller's executor.
    void request_shutdown();

    [[nodiscard]] boost::asio::any_io_executor executor() { return m_io.get_executor(); }

    // =========================================================================
    // State
    // =========================================================================

    [[nodiscard]] const VmSession& session() const { return m_session; }
    [[nodiscard]] const SessionConfig& config() const { return m_config; }
    [[nodiscard]] const std::filesystem::path& log_path() const { return m_log_path; }
    [[nodiscard]] const std::filesystem::path& control_socket() const { return m_control_socket; }
    [[nodiscard]] bool shutdown_requested() const { return m_shutdown_requested.is_set(); }

    /// Session log, available once run() has opened it
    [[nodiscard]] vmw_core::SessionLog* log() { return m_log.get(); }

private:
    void spawn_tasks();
    boost::asio::awaitable<void> supervise();
    void handle_timeout(TimeoutKind kind);
    void arm_interrupt();
    RunResult collect_result() const;

    // Declared first: destroyed after everything that refers to its executor
    boost::asio::io_context m_io;

    SessionConfig m_config;
    VmSession m_session;
    vmw_async::OneShotEvent m_shutdown_requested;
    boost::asio::signal_set m_interrupts;

    std::filesystem::path m_log_path;
    std::filesystem::path m_control_socket;
    std::optional<LaunchCommand> m_launch_override;

    std::unique_ptr<vmw_core::SessionLog> m_log;
    std::unique_ptr<vmw_async::TaskGroup> m_tasks;
    std::unique_ptr<LifecycleContext> m_context;

    std::unique_ptr<ProcessSupervisor> m_supervisor;
    std::unique_ptr<BootProbe> m_boot_probe;
    std::unique_ptr<ProgressReporter> m_progress;
    std::unique_ptr<BootWatchdog> m_boot_watchdog;
    std::unique_ptr<ShutdownNegotiator> m_shutdown;
    std::unique_ptr<ShutdownWatchdog> m_shutdown_watchdog;

    TaskEventCallback m_on_task_event;
    TimeoutKind m_timeout = TimeoutKind::None;
    bool m_started = false;

    std::ostream* m_out;
    std::ostream* m_err;
};

} // namespace vmw_vm
