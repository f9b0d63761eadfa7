/// @file watchdog.hpp
/// @brief Boot and shutdown timeouts
///
/// Each watchdog is a delay followed by a conditional action. Being cancelled
/// while waiting is the normal outcome when the guarded phase completes in
/// time; the task then ends as cancelled, not failed.

#pragma once

#include "context.hpp"
#include "types.hpp"

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>

#include <functional>

namespace vmw_vm {

/// Invoked when a watchdog fires
using TimeoutHandler = std::function<void(TimeoutKind)>;

/// Fires if the session is still Booting after the boot timeout
class BootWatchdog {
public:
    BootWatchdog(LifecycleContext& context, TimeoutHandler on_timeout);

    boost::asio::awaitable<void> run(vmw_async::Task& task);

    [[nodiscard]] bool fired() const { return m_fired; }

private:
    LifecycleContext& m_ctx;
    TimeoutHandler m_on_timeout;
    bool m_fired = false;
};

/// Fires once the shutdown timeout has elapsed after the shutdown request.
/// Arms only after the boot probe finished and shutdown was requested.
class ShutdownWatchdog {
public:
    ShutdownWatchdog(LifecycleContext& context, TimeoutHandler on_timeout);

    boost::asio::awaitable<void> run(vmw_async::Task& task);

    [[nodiscard]] bool fired() const { return m_fired; }

private:
    LifecycleContext& m_ctx;
    TimeoutHandler m_on_timeout;
    bool m_fired = false;
};

} // namespace vmw_vm
