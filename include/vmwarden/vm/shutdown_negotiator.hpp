/// @file shutdown_negotiator.hpp
/// @brief Graceful power-down through the QMP control socket
///
/// Sequence: wait for the boot probe to finish, connect and negotiate
/// capabilities, wait for the shutdown request, send system_powerdown, then
/// read until the SHUTDOWN event. Any protocol or connection failure ends
/// the task with a QmpError; nothing is retried.

#pragma once

#include "context.hpp"

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>

#include <cstddef>
#include <filesystem>

namespace vmw_vm {

class ShutdownNegotiator {
public:
    ShutdownNegotiator(LifecycleContext& context, std::filesystem::path control_socket);

    /// Task body
    boost::asio::awaitable<void> run(vmw_async::Task& task);

    [[nodiscard]] std::size_t powerdowns_sent() const { return m_powerdowns_sent; }
    [[nodiscard]] bool shutdown_event_seen() const { return m_shutdown_event_seen; }

private:
    LifecycleContext& m_ctx;
    std::filesystem::path m_control_socket;
    std::size_t m_powerdowns_sent = 0;
    bool m_shutdown_event_seen = false;
};

} // namespace vmw_vm
