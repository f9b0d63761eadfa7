/// @file progress.hpp
/// @brief Once-per-interval phase heartbeat on the interactive output

#pragma once

#include "context.hpp"

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>

#include <cstddef>

namespace vmw_vm {

class ProgressReporter {
public:
    explicit ProgressReporter(LifecycleContext& context);

    /// Task body: print one phase character per interval until Off
    boost::asio::awaitable<void> run(vmw_async::Task& task);

    [[nodiscard]] std::size_t ticks() const { return m_ticks; }
    [[nodiscard]] bool shutdown_announced() const { return m_shutdown_announced; }

private:
    void tick();

    LifecycleContext& m_ctx;
    std::size_t m_ticks = 0;
    bool m_shutdown_announced = false;
};

} // namespace vmw_vm
