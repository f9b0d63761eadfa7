/// @file progress.cpp
/// @brief ProgressReporter implementation

#include <vmwarden/vm/progress.hpp>
#include <vmwarden/vm/session.hpp>
#include <vmwarden/async/task.hpp>
#include <vmwarden/core/log.hpp>
#include <vmwarden/core/session_log.hpp>

#include <ostream>

namespace vmw_vm {

namespace asio = boost::asio;

ProgressReporter::ProgressReporter(LifecycleContext& context)
    : m_ctx(context)
{
}

asio::awaitable<void> ProgressReporter::run(vmw_async::Task& task) {
    while (m_ctx.session.phase() != Phase::Off) {
        tick();
        co_await task.sleep(m_ctx.config.progress_interval);
    }
}

void ProgressReporter::tick() {
    ++m_ticks;
    auto& out = m_ctx.out;

    out << phase_char(m_ctx.session.phase()) << std::flush;

    if (!m_shutdown_announced && m_ctx.shutdown_requested.is_set()) {
        m_shutdown_announced = true;
        out << "\nShutdown requested\n" << std::flush;
        m_ctx.log.line("Shutdown requested");
    }

    if (!out) {
        vmw_core::vm_logger()->warn("Progress output failed");
        out.clear();
    }
}

} // namespace vmw_vm
