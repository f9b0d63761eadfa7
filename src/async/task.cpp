/// @file task.cpp
/// @brief Task and TaskGroup implementation

#include <vmwarden/async/task.hpp>
#include <vmwarden/core/log.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/core/demangle.hpp>

#include <algorithm>
#include <stdexcept>
#include <typeinfo>

namespace vmw_async {

namespace asio = boost::asio;

const char* to_string(TaskState state) {
    switch (state) {
        case TaskState::Pending: return "pending";
        case TaskState::Running: return "running";
        case TaskState::Completed: return "completed";
        case TaskState::Cancelled: return "cancelled";
        case TaskState::Failed: return "failed";
        default: return "unknown";
    }
}

const char* to_string(TaskEventType type) {
    switch (type) {
        case TaskEventType::Started: return "started";
        case TaskEventType::Completed: return "completed";
        case TaskEventType::Cancelled: return "cancelled";
        case TaskEventType::Failed: return "failed";
        default: return "unknown";
    }
}

// =============================================================================
// Task
// =============================================================================

Task::CancelHook::~CancelHook() {
    if (m_task) {
        m_task->m_cancel_hooks.erase(m_id);
    }
}

Task::Task(std::string name, Body body, asio::any_io_executor executor)
    : m_name(std::move(name))
    , m_body(std::move(body))
    , m_executor(executor)
    , m_finished(executor)
{
}

bool Task::done() const {
    return m_state == TaskState::Completed
        || m_state == TaskState::Cancelled
        || m_state == TaskState::Failed;
}

void Task::cancel() {
    if (done() || m_cancel_requested) {
        return;
    }
    m_cancel_requested = true;
    vmw_core::core_logger()->debug("Cancelling task '{}' ({})", m_name, to_string(m_state));

    // Hooks may unregister themselves while running
    auto hooks = m_cancel_hooks;
    for (auto& [id, hook] : hooks) {
        hook();
    }
}

void Task::throw_if_cancelled() const {
    if (m_cancel_requested) {
        throw TaskCancelled();
    }
}

Task::CancelHook Task::on_cancel(std::function<void()> fn) {
    std::uint64_t id = m_next_hook_id++;
    m_cancel_hooks.emplace(id, std::move(fn));
    return CancelHook(*this, id);
}

asio::awaitable<void> Task::sleep(Clock::duration duration) {
    throw_if_cancelled();

    asio::steady_timer timer(m_executor, duration);
    auto hook = on_cancel([&timer] { timer.cancel(); });

    boost::system::error_code ec;
    co_await timer.async_wait(asio::redirect_error(asio::use_awaitable, ec));

    throw_if_cancelled();
}

asio::awaitable<void> Task::join(Task& other) {
    if (!other.done()) {
        co_await other.m_finished.wait(*this);
    }
    throw_if_cancelled();

    switch (other.state()) {
        case TaskState::Cancelled:
            throw TaskCancelled();
        case TaskState::Failed:
            throw std::runtime_error("Task '" + other.name() + "' failed: "
                + (other.failure() ? other.failure()->message() : std::string("unknown error")));
        default:
            break;
    }
}

// =============================================================================
// TaskGroup
// =============================================================================

TaskGroup::TaskGroup(asio::any_io_executor executor)
    : m_executor(std::move(executor))
{
}

TaskGroup::~TaskGroup() {
    if (!all_done()) {
        vmw_core::core_logger()->warn("Task group destroyed with unfinished tasks");
    }
}

Task& TaskGroup::spawn(std::string name, Task::Body body) {
    auto task = std::make_unique<Task>(std::move(name), std::move(body), m_executor);
    Task& ref = *task;
    m_tasks.push_back(std::move(task));

    asio::co_spawn(m_executor, run_task(ref), [](std::exception_ptr e) {
        // run_task records every outcome itself; anything escaping is a bug
        if (e) {
            std::rethrow_exception(e);
        }
    });
    return ref;
}

Task* TaskGroup::find(std::string_view name) {
    for (auto& task : m_tasks) {
        if (task->name() == name) {
            return task.get();
        }
    }
    return nullptr;
}

const Task* TaskGroup::find(std::string_view name) const {
    for (const auto& task : m_tasks) {
        if (task->name() == name) {
            return task.get();
        }
    }
    return nullptr;
}

Task& TaskGroup::get(std::string_view name) {
    if (auto* task = find(name)) {
        return *task;
    }
    throw std::out_of_range("No task named '" + std::string(name) + "'");
}

std::vector<std::string> TaskGroup::names() const {
    std::vector<std::string> result;
    result.reserve(m_tasks.size());
    for (const auto& task : m_tasks) {
        result.push_back(task->name());
    }
    return result;
}

void TaskGroup::cancel(std::string_view name) {
    if (auto* task = find(name)) {
        task->cancel();
    }
}

void TaskGroup::cancel(std::initializer_list<std::string_view> names) {
    for (auto name : names) {
        cancel(name);
    }
}

void TaskGroup::cancel(const std::vector<std::string>& names) {
    for (const auto& name : names) {
        cancel(std::string_view(name));
    }
}

void TaskGroup::cancel_all() {
    for (auto& task : m_tasks) {
        task->cancel();
    }
}

void TaskGroup::cancel_all_except(std::string_view name) {
    for (auto& task : m_tasks) {
        if (task->name() != name) {
            task->cancel();
        }
    }
}

asio::awaitable<void> TaskGroup::join_all() {
    // Index loop: tasks spawned while joining are joined as well
    for (std::size_t i = 0; i < m_tasks.size(); ++i) {
        co_await m_tasks[i]->m_finished.wait();
    }
}

bool TaskGroup::all_done() const {
    return std::all_of(m_tasks.begin(), m_tasks.end(),
                       [](const auto& task) { return task->done(); });
}

std::vector<vmw_core::Error> TaskGroup::failures() const {
    std::vector<vmw_core::Error> result;
    for (const auto& task : m_tasks) {
        if (task->state() == TaskState::Failed && task->failure()) {
            result.push_back(*task->failure());
        }
    }
    return result;
}

void TaskGroup::set_event_callback(EventCallback callback) {
    m_event_callback = std::move(callback);
}

asio::awaitable<void> TaskGroup::run_task(Task& task) {
    if (task.cancel_requested()) {
        finish(task, TaskState::Cancelled, std::nullopt);
        co_return;
    }

    task.m_state = TaskState::Running;
    emit_event(TaskEvent{task.name(), TaskEventType::Started, {}});

    std::optional<vmw_core::Error> failure;
    bool cancelled = false;
    try {
        co_await task.m_body(task);
    } catch (const TaskCancelled&) {
        cancelled = true;
    } catch (const vmw_core::ErrorException& e) {
        if (task.cancel_requested()) {
            cancelled = true;
        } else {
            failure = e.error();
            failure->with_context("task", task.name())
                .with_context("type", boost::core::demangle(typeid(e).name()));
        }
    } catch (const std::exception& e) {
        if (task.cancel_requested()) {
            // Interrupted operation reported its abort as an error
            cancelled = true;
        } else {
            failure = vmw_core::Error(vmw_core::ErrorCode::InternalError, e.what())
                .with_context("task", task.name())
                .with_context("type", boost::core::demangle(typeid(e).name()));
        }
    } catch (...) {
        failure = vmw_core::Error(vmw_core::ErrorCode::Unknown, "Unknown exception")
            .with_context("task", task.name())
            .with_context("type", "unknown");
    }

    if (failure) {
        finish(task, TaskState::Failed, std::move(failure));
    } else if (cancelled) {
        finish(task, TaskState::Cancelled, std::nullopt);
    } else {
        finish(task, TaskState::Completed, std::nullopt);
    }
}

void TaskGroup::finish(Task& task, TaskState state, std::optional<vmw_core::Error> failure) {
    task.m_state = state;
    task.m_cancel_hooks.clear();

    TaskEvent event{task.name(), TaskEventType::Completed, {}};
    switch (state) {
        case TaskState::Cancelled:
            event.type = TaskEventType::Cancelled;
            break;
        case TaskState::Failed:
            event.type = TaskEventType::Failed;
            event.message = failure ? failure->message() : std::string();
            vmw_core::core_logger()->debug("Task '{}' failed: {}", task.name(), event.message);
            break;
        default:
            break;
    }
    task.m_failure = std::move(failure);

    emit_event(event);
    task.m_finished.set();
}

void TaskGroup::emit_event(const TaskEvent& event) {
    if (m_event_callback) {
        m_event_callback(event);
    }
}

} // namespace vmw_async
