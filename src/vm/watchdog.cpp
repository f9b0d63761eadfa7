/// @file watchdog.cpp
/// @brief BootWatchdog and ShutdownWatchdog implementation

#include <vmwarden/vm/watchdog.hpp>
#include <vmwarden/vm/session.hpp>
#include <vmwarden/async/task.hpp>
#include <vmwarden/core/log.hpp>

namespace vmw_vm {

namespace asio = boost::asio;

// =============================================================================
// BootWatchdog
// =============================================================================

BootWatchdog::BootWatchdog(LifecycleContext& context, TimeoutHandler on_timeout)
    : m_ctx(context)
    , m_on_timeout(std::move(on_timeout))
{
}

asio::awaitable<void> BootWatchdog::run(vmw_async::Task& task) {
    co_await task.sleep(m_ctx.config.boot_timeout);

    if (m_ctx.session.phase() == Phase::Booting) {
        m_fired = true;
        vmw_core::vm_logger()->warn("Boot timeout expired");
        m_on_timeout(TimeoutKind::Boot);
    }
}

// =============================================================================
// ShutdownWatchdog
// =============================================================================

ShutdownWatchdog::ShutdownWatchdog(LifecycleContext& context, TimeoutHandler on_timeout)
    : m_ctx(context)
    , m_on_timeout(std::move(on_timeout))
{
}

asio::awaitable<void> ShutdownWatchdog::run(vmw_async::Task& task) {
    co_await task.join(m_ctx.tasks.get(task_names::kBootProbe));
    co_await m_ctx.shutdown_requested.wait(task);
    co_await task.sleep(m_ctx.config.shutdown_timeout);

    m_fired = true;
    vmw_core::vm_logger()->warn("Shutdown timeout expired");
    m_on_timeout(TimeoutKind::Shutdown);
}

} // namespace vmw_vm
