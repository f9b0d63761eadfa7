/// @file boot_probe.cpp
/// @brief BootProbe implementation

#include <vmwarden/vm/boot_probe.hpp>
#include <vmwarden/vm/session.hpp>
#include <vmwarden/async/task.hpp>
#include <vmwarden/core/log.hpp>
#include <vmwarden/core/session_log.hpp>

#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/fmt/fmt.h>

#include <ostream>

namespace vmw_vm {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

BootProbe::BootProbe(LifecycleContext& context)
    : m_ctx(context)
{
}

asio::awaitable<void> BootProbe::run(vmw_async::Task& task) {
    while (m_ctx.session.phase() == Phase::Booting) {
        m_ctx.log.line("Attempt ssh connection");

        bool answered = co_await attempt(task);
        if (answered && m_ctx.session.phase() == Phase::Booting) {
            auto result = m_ctx.session.transition_to(Phase::Running);
            if (!result) {
                vmw_core::vm_logger()->warn("{}", result.error().message());
            }
            m_ctx.tasks.cancel(task_names::kBootWatchdog);
            break;
        }
        if (answered) {
            break;
        }

        co_await task.sleep(m_ctx.config.probe_interval);
    }

    if (m_ctx.session.phase() != Phase::Running) {
        m_ctx.err << "State changed before successful connection to localhost:"
                  << m_ctx.session.spec().port << '\n';
        m_ctx.err.flush();
    }
}

asio::awaitable<bool> BootProbe::attempt(vmw_async::Task& task) {
    task.throw_if_cancelled();
    ++m_attempts;

    boost::system::error_code ec;
    auto address = asio::ip::make_address(m_ctx.config.probe_host, ec);
    if (ec) {
        vmw_core::vm_logger()->error("Invalid probe host '{}': {}", m_ctx.config.probe_host, ec.message());
        co_return false;
    }
    tcp::endpoint endpoint(address, m_ctx.session.spec().port);

    tcp::socket socket(task.executor());
    auto hook = task.on_cancel([&socket] {
        boost::system::error_code ignored;
        socket.close(ignored);
    });

    co_await socket.async_connect(endpoint, asio::redirect_error(asio::use_awaitable, ec));
    task.throw_if_cancelled();
    if (ec) {
        vmw_core::vm_logger()->debug("Probe {} failed: {}", m_attempts, ec.message());
        co_return false;
    }

    // EOF before a newline leaves the partial reply in the buffer
    std::string buffer;
    std::size_t n = co_await asio::async_read_until(
        socket, asio::dynamic_buffer(buffer, kMaxBannerLength), '\n',
        asio::redirect_error(asio::use_awaitable, ec));
    task.throw_if_cancelled();

    if (ec == asio::error::not_found) {
        socket.close(ec);
        m_ctx.log.line(fmt::format("Reply longer than {} bytes from guest ssh service", kMaxBannerLength));
        co_return false;
    }

    std::string reply = ec ? buffer : buffer.substr(0, n);
    if (ec) {
        vmw_core::vm_logger()->debug("Probe {} read ended: {}", m_attempts, ec.message());
    }

    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);

    m_ctx.log.line(fmt::format("Reply {} from guest ssh service", vmw_core::escape_bytes(reply)));

    co_return !reply.empty() && reply.compare(0, kSshBannerPrefix.size(), kSshBannerPrefix) == 0;
}

} // namespace vmw_vm
