/// @file event.cpp
/// @brief OneShotEvent implementation

#include <vmwarden/async/event.hpp>
#include <vmwarden/async/task.hpp>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <optional>

namespace vmw_async {

namespace asio = boost::asio;

namespace {

/// Removes a parked timer from the waiter list when the wait ends, including
/// when the coroutine frame is destroyed mid-wait.
struct WaiterRegistration {
    std::list<asio::steady_timer*>& waiters;
    std::list<asio::steady_timer*>::iterator position;

    ~WaiterRegistration() { waiters.erase(position); }
};

} // anonymous namespace

OneShotEvent::OneShotEvent(asio::any_io_executor executor)
    : m_executor(std::move(executor))
{
}

void OneShotEvent::set() {
    if (m_set) {
        return;
    }
    m_set = true;
    for (auto* timer : m_waiters) {
        timer->cancel();
    }
}

asio::awaitable<void> OneShotEvent::wait(Task& waiter) {
    co_await wait_impl(&waiter);
}

asio::awaitable<void> OneShotEvent::wait() {
    co_await wait_impl(nullptr);
}

asio::awaitable<void> OneShotEvent::wait_impl(Task* waiter) {
    if (waiter) {
        waiter->throw_if_cancelled();
    }
    if (m_set) {
        co_return;
    }

    asio::steady_timer timer(m_executor, asio::steady_timer::time_point::max());
    WaiterRegistration registration{m_waiters, m_waiters.insert(m_waiters.end(), &timer)};

    std::optional<Task::CancelHook> hook;
    if (waiter) {
        hook.emplace(waiter->on_cancel([&timer] { timer.cancel(); }));
    }

    boost::system::error_code ec;
    while (!m_set && !(waiter && waiter->cancel_requested())) {
        co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));
    }

    if (waiter) {
        waiter->throw_if_cancelled();
    }
}

} // namespace vmw_async
