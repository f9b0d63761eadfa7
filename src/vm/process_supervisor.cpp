/// @file process_supervisor.cpp
/// @brief ProcessSupervisor implementation

#include <vmwarden/vm/process_supervisor.hpp>
#include <vmwarden/vm/session.hpp>
#include <vmwarden/async/task.hpp>
#include <vmwarden/core/log.hpp>
#include <vmwarden/core/session_log.hpp>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/fmt/fmt.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <string>
#include <sys/wait.h>
#include <vector>

namespace vmw_vm {

namespace asio = boost::asio;

ProcessSupervisor::ProcessSupervisor(LifecycleContext& context, LaunchCommand command)
    : m_ctx(context)
    , m_command(std::move(command))
{
}

bool ProcessSupervisor::running() const {
    return m_pid > 0 && !m_exited;
}

asio::awaitable<void> ProcessSupervisor::run(vmw_async::Task& task) {
    try {
        co_await supervise(task);
    } catch (...) {
        cleanup();
        throw;
    }
    cleanup();
}

asio::awaitable<void> ProcessSupervisor::supervise(vmw_async::Task& task) {
    task.throw_if_cancelled();

    // Installed before fork so an early exit is not missed
    asio::signal_set child_signals(task.executor(), SIGCHLD);

    m_pid = spawn();
    m_ctx.session.set_pid(m_pid);
    m_ctx.log.line(fmt::format("Subprocess Id {}", m_pid));
    vmw_core::vm_logger()->info("Started {} as pid {}", m_command.program, m_pid);

    auto hook = task.on_cancel([&child_signals] {
        boost::system::error_code ec;
        child_signals.cancel(ec);
        if (ec) {
            vmw_core::vm_logger()->debug("Cancelling SIGCHLD wait: {}", ec.message());
        }
    });

    for (;;) {
        int status = 0;
        pid_t reaped = ::waitpid(m_pid, &status, WNOHANG);
        if (reaped == m_pid) {
            record_exit(status);
            break;
        }
        if (reaped < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            throw SupervisorError(vmw_core::ProcessError::wait_failed(err, std::strerror(err)));
        }

        boost::system::error_code ec;
        co_await child_signals.async_wait(asio::redirect_error(asio::use_awaitable, ec));
        task.throw_if_cancelled();
    }

    if (*m_ctx.session.exit_code() == kGenericFailureExit && log_reports_memory_failure()) {
        m_ctx.session.set_memory_failure(true);
    }
}

pid_t ProcessSupervisor::spawn() {
    const std::string log_path = m_ctx.log.path().string();

    vmw_core::UniqueFd log_fd(::open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644));
    if (!log_fd) {
        int err = errno;
        throw SupervisorError(vmw_core::ProcessError::log_unavailable(log_path, err, std::strerror(err)));
    }

    int stdin_pipe[2];
    int status_pipe[2];
    if (::pipe2(stdin_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        throw SupervisorError(vmw_core::ProcessError::spawn_failed(m_command.program, err, std::strerror(err)));
    }
    vmw_core::UniqueFd stdin_read(stdin_pipe[0]);
    vmw_core::UniqueFd stdin_write(stdin_pipe[1]);

    if (::pipe2(status_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        throw SupervisorError(vmw_core::ProcessError::spawn_failed(m_command.program, err, std::strerror(err)));
    }
    vmw_core::UniqueFd status_read(status_pipe[0]);
    vmw_core::UniqueFd status_write(status_pipe[1]);

    // Built before fork: the child may only call async-signal-safe functions
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(m_command.program.c_str()));
    for (const auto& arg : m_command.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    vmw_core::vm_logger()->debug("Launching: {}", m_command.to_string());

    // Text written so far must precede the child's output
    m_ctx.log.flush();

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        throw SupervisorError(vmw_core::ProcessError::spawn_failed(m_command.program, err, std::strerror(err)));
    }

    if (pid == 0) {
        // Child: own session, so a terminal interrupt reaches only vmwarden
        ::setsid();
        ::dup2(stdin_read.get(), STDIN_FILENO);
        ::dup2(log_fd.get(), STDOUT_FILENO);
        ::dup2(log_fd.get(), STDERR_FILENO);

        ::execvp(argv[0], argv.data());

        int err = errno;
        ssize_t written = ::write(status_write.get(), &err, sizeof(err));
        ::_exit(written == static_cast<ssize_t>(sizeof(err)) ? 127 : 126);
    }

    // Parent
    stdin_read.reset();
    status_write.reset();

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_read.get(), &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        throw SupervisorError(vmw_core::ProcessError::spawn_failed(
            m_command.program, child_errno, std::strerror(child_errno)));
    }

    m_stdin = std::move(stdin_write);
    return pid;
}

void ProcessSupervisor::record_exit(int status) {
    m_exited = true;

    int code;
    if (WIFEXITED(status)) {
        code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        code = -WTERMSIG(status);
    } else {
        code = -1;
    }
    m_ctx.session.set_exit_code(code);
    vmw_core::vm_logger()->info("Process {} exited with status {}", m_pid, code);
}

bool ProcessSupervisor::log_reports_memory_failure() const {
    std::ifstream file(m_ctx.log.path(), std::ios::binary);
    if (!file) {
        vmw_core::vm_logger()->warn("Cannot reopen {} to scan for memory errors",
                                    m_ctx.log.path().string());
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        if (line.find(kMemoryFailureMarker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

void ProcessSupervisor::cleanup() {
    m_ctx.tasks.cancel({
        task_names::kShutdown,
        task_names::kBootProbe,
        task_names::kShutdownWatchdog,
        task_names::kBootWatchdog,
    });
    m_ctx.session.force_off();
    m_stdin.reset();
}

vmw_core::Result<void> ProcessSupervisor::kill_process_group(int signal) {
    if (!running()) {
        return vmw_core::Err(vmw_core::Error(vmw_core::ErrorCode::InvalidState, "No running process to signal"));
    }
    if (::kill(-m_pid, signal) != 0) {
        int err = errno;
        return vmw_core::Err(
            vmw_core::Error(vmw_core::ErrorCode::IOError,
                            fmt::format("kill({}, {}) failed: {}", -m_pid, signal, std::strerror(err)))
                .with_context("pid", std::to_string(m_pid)));
    }
    vmw_core::vm_logger()->info("Sent signal {} to process group {}", signal, m_pid);
    return vmw_core::Ok();
}

} // namespace vmw_vm
