/// @file controller.cpp
/// @brief Controller implementation

#include <vmwarden/vm/controller.hpp>
#include <vmwarden/vm/boot_probe.hpp>
#include <vmwarden/vm/command.hpp>
#include <vmwarden/vm/process_supervisor.hpp>
#include <vmwarden/vm/progress.hpp>
#include <vmwarden/vm/shutdown_negotiator.hpp>
#include <vmwarden/vm/watchdog.hpp>
#include <vmwarden/core/log.hpp>

#include <boost/asio/co_spawn.hpp>

#include <csignal>
#include <iostream>
#include <string>

namespace vmw_vm {

namespace asio = boost::asio;

Controller::Controller(VmSpec spec, SessionConfig config)
    : m_config(std::move(config))
    , m_session(std::move(spec))
    , m_shutdown_requested(m_io.get_executor())
    , m_interrupts(m_io)
    , m_out(&std::cout)
    , m_err(&std::cerr)
{
    m_log_path = session_log_path(m_session.spec(), m_config.log_directory);
    m_control_socket = m_config.control_socket.empty()
        ? default_control_socket_path()
        : m_config.control_socket;
}

Controller::~Controller() = default;

void Controller::set_output(std::ostream& out, std::ostream& err) {
    m_out = &out;
    m_err = &err;
}

void Controller::set_on_phase_change(PhaseCallback callback) {
    m_session.set_phase_callback(std::move(callback));
}

void Controller::set_on_task_event(TaskEventCallback callback) {
    m_on_task_event = std::move(callback);
}

void Controller::set_launch_command(LaunchCommand command) {
    m_launch_override = std::move(command);
}

void Controller::request_shutdown() {
    if (!m_shutdown_requested.is_set()) {
        vmw_core::vm_logger()->info("Shutdown requested");
    }
    m_shutdown_requested.set();
}

// =============================================================================
// Run
// =============================================================================

vmw_core::Result<RunResult> Controller::run() {
    if (m_started) {
        return vmw_core::Err<RunResult>(
            vmw_core::Error(vmw_core::ErrorCode::InvalidState, "Controller already ran"));
    }
    m_started = true;

    // Recreated so the hypervisor and vmwarden both append to a fresh file
    auto log = vmw_core::SessionLog::open(
        m_log_path, vmw_core::SessionLogOptions{true, m_config.flush_log});
    if (!log) {
        return vmw_core::Err<RunResult>(log.error());
    }
    m_log = std::move(log).value();

    m_tasks = std::make_unique<vmw_async::TaskGroup>(m_io.get_executor());
    m_tasks->set_event_callback([this](const vmw_async::TaskEvent& event) {
        vmw_core::vm_logger()->debug("Task '{}' {}", event.task_name, vmw_async::to_string(event.type));
        if (m_on_task_event) {
            m_on_task_event(event);
        }
    });

    m_context = std::make_unique<LifecycleContext>(LifecycleContext{
        m_session, *m_log, *m_tasks, m_shutdown_requested, m_config, *m_out, *m_err});

    auto on_timeout = [this](TimeoutKind kind) { handle_timeout(kind); };
    m_supervisor = std::make_unique<ProcessSupervisor>(
        *m_context,
        m_launch_override ? *m_launch_override : build_qemu_command(m_session.spec(), m_control_socket));
    m_boot_probe = std::make_unique<BootProbe>(*m_context);
    m_progress = std::make_unique<ProgressReporter>(*m_context);
    m_boot_watchdog = std::make_unique<BootWatchdog>(*m_context, on_timeout);
    m_shutdown = std::make_unique<ShutdownNegotiator>(*m_context, m_control_socket);
    m_shutdown_watchdog = std::make_unique<ShutdownWatchdog>(*m_context, on_timeout);

    auto booting = m_session.transition_to(Phase::Booting);
    if (!booting) {
        return vmw_core::Err<RunResult>(booting.error());
    }

    boost::system::error_code ec;
    m_interrupts.add(SIGINT, ec);
    if (ec) {
        vmw_core::vm_logger()->warn("Cannot handle SIGINT: {}", ec.message());
    } else {
        arm_interrupt();
    }

    spawn_tasks();

    m_log->plain("");
    m_log->line("Starting event loop");

    asio::co_spawn(m_io, supervise(), [](std::exception_ptr e) {
        if (e) {
            std::rethrow_exception(e);
        }
    });
    m_io.run();

    return vmw_core::Ok(collect_result());
}

void Controller::spawn_tasks() {
    namespace names = task_names;
    using vmw_async::Task;

    m_tasks->spawn(names::kProcess, [this](Task& t) { return m_supervisor->run(t); });
    m_tasks->spawn(names::kBootProbe, [this](Task& t) { return m_boot_probe->run(t); });
    m_tasks->spawn(names::kProgress, [this](Task& t) { return m_progress->run(t); });
    m_tasks->spawn(names::kBootWatchdog, [this](Task& t) { return m_boot_watchdog->run(t); });
    m_tasks->spawn(names::kShutdown, [this](Task& t) { return m_shutdown->run(t); });
    m_tasks->spawn(names::kShutdownWatchdog, [this](Task& t) { return m_shutdown_watchdog->run(t); });
}

asio::awaitable<void> Controller::supervise() {
    co_await m_tasks->join_all();

    boost::system::error_code ec;
    m_interrupts.cancel(ec);
    if (ec) {
        vmw_core::vm_logger()->debug("Cancelling SIGINT wait: {}", ec.message());
    }

    m_log->line(m_session.summary());

    auto failures = m_tasks->failures();
    if (!failures.empty()) {
        std::string block(78, '-');
        block += "\nErrors were produced while running the control script:\n";
        for (const auto& failure : failures) {
            block += '\n';
            block += vmw_core::build_error_chain(failure);
            block += '\n';
        }
        block.pop_back();
        m_log->plain(block);
    }
    m_log->flush();
}

void Controller::arm_interrupt() {
    m_interrupts.async_wait([this](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            return;
        }
        vmw_core::vm_logger()->debug("Received signal {}", signal_number);
        request_shutdown();
        arm_interrupt();
    });
}

void Controller::handle_timeout(TimeoutKind kind) {
    if (m_timeout == TimeoutKind::None) {
        m_timeout = kind;
    }

    *m_err << (kind == TimeoutKind::Boot ? "\nTimed out.\n" : "\nShut down timed out.\n");
    m_err->flush();
    m_log->line(kind == TimeoutKind::Boot ? "Boot timed out" : "Shut down timed out");

    if (m_config.timeout_policy == TimeoutPolicy::Kill && m_supervisor->running()) {
        auto killed = m_supervisor->kill_process_group(SIGKILL);
        if (killed) {
            m_tasks->cancel_all_except(task_names::kProcess);
            return;
        }
        vmw_core::vm_logger()->error("{}", vmw_core::build_error_chain(killed.error()));
    }

    // May leave the hypervisor running in the background
    m_tasks->cancel_all();
}

RunResult Controller::collect_result() const {
    RunResult result;
    result.final_phase = m_session.phase();
    result.pid = m_session.pid();
    result.exit_code = m_session.exit_code();
    result.memory_failure = m_session.memory_failure();
    result.control_established = m_session.control_established();
    result.timeout = m_timeout;
    result.task_errors = m_tasks ? m_tasks->failures() : std::vector<vmw_core::Error>{};
    result.log_path = m_log_path;
    return result;
}

} // namespace vmw_vm
