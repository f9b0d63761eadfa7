/// @file boot_probe.hpp
/// @brief Polls the forwarded guest ssh port until the guest answers

#pragma once

#include "context.hpp"

#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>

#include <cstddef>
#include <string>

namespace vmw_vm {

class BootProbe {
public:
    explicit BootProbe(LifecycleContext& context);

    /// Task body: probe while Booting, move to Running on a valid banner
    boost::asio::awaitable<void> run(vmw_async::Task& task);

    /// Connect once, read the first line and close.
    /// Returns true if the line carries the SSH-2 banner. Connection errors
    /// count as a failed attempt.
    boost::asio::awaitable<bool> attempt(vmw_async::Task& task);

    [[nodiscard]] std::size_t attempts() const { return m_attempts; }

private:
    LifecycleContext& m_ctx;
    std::size_t m_attempts = 0;
};

} // namespace vmw_vm
