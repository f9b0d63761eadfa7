/// @file event.hpp
/// @brief One-shot broadcast event for cooperative tasks

#pragma once

#include "fwd.hpp"

#include <boost/asio/any_io_executor.hpp>
#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>

#include <cstddef>
#include <list>

namespace vmw_async {

/// Event that is set at most once and observed by any number of waiters.
///
/// Each waiter parks on its own timer; set() wakes all of them. Setting an
/// already-set event is a no-op, and the event is never reset.
class OneShotEvent {
public:
    explicit OneShotEvent(boost::asio::any_io_executor executor);

    OneShotEvent(const OneShotEvent&) = delete;
    OneShotEvent& operator=(const OneShotEvent&) = delete;

    /// Raise the event (idempotent)
    void set();

    [[nodiscard]] bool is_set() const { return m_set; }

    /// Number of coroutines currently parked on the event
    [[nodiscard]] std::size_t waiter_count() const { return m_waiters.size(); }

    /// Wait on behalf of @p waiter; throws TaskCancelled if it is cancelled first
    boost::asio::awaitable<void> wait(Task& waiter);

    /// Wait without cancellation (used by joiners that must see completion)
    boost::asio::awaitable<void> wait();

private:
    boost::asio::awaitable<void> wait_impl(Task* waiter);

    boost::asio::any_io_executor m_executor;
    bool m_set = false;
    std::list<boost::asio::steady_timer*> m_waiters;
};

} // namespace vmw_async
