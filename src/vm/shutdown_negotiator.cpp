/// @file shutdown_negotiator.cpp
/// @brief ShutdownNegotiator implementation

#include <vmwarden/vm/shutdown_negotiator.hpp>
#include <vmwarden/vm/session.hpp>
#include <vmwarden/async/task.hpp>
#include <vmwarden/core/log.hpp>
#include <vmwarden/core/session_log.hpp>
#include <vmwarden/qmp/client.hpp>

#include <spdlog/fmt/fmt.h>

namespace vmw_vm {

namespace asio = boost::asio;

ShutdownNegotiator::ShutdownNegotiator(LifecycleContext& context, std::filesystem::path control_socket)
    : m_ctx(context)
    , m_control_socket(std::move(control_socket))
{
}

asio::awaitable<void> ShutdownNegotiator::run(vmw_async::Task& task) {
    // Bounded externally by the boot watchdog
    co_await task.join(m_ctx.tasks.get(task_names::kBootProbe));

    vmw_qmp::QmpClient client(task.executor(), m_control_socket);
    co_await client.connect(task);
    m_ctx.log.line(fmt::format("Opened socket {}", m_control_socket.string()));

    co_await client.negotiate(task);
    m_ctx.session.set_control_established(true);
    m_ctx.log.line("Established QMP connection");

    co_await m_ctx.shutdown_requested.wait(task);

    co_await client.send_command(task, vmw_qmp::kPowerdownCommand);
    ++m_powerdowns_sent;
    auto result = m_ctx.session.transition_to(Phase::ShuttingDown);
    if (!result) {
        vmw_core::vm_logger()->warn("{}", result.error().message());
    }
    m_ctx.log.line("Sent system_powerdown command");

    auto event = co_await client.wait_for_event(task, vmw_qmp::kShutdownEvent);
    m_shutdown_event_seen = true;
    m_ctx.log.line(fmt::format("Received {}", event.dump()));
}

} // namespace vmw_vm
