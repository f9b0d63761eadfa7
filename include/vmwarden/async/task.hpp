/// @file task.hpp
/// @brief Named cooperative tasks with group-wide cancellation
///
/// Provides a small structured-concurrency scope on top of Boost.Asio
/// coroutines:
/// - Tasks are named and owned by a TaskGroup
/// - Cancellation is cooperative: the operation a task is suspended in is
///   interrupted, and the task sees TaskCancelled when it resumes
/// - Cancelling a finished task is a no-op; cancelling a task that has not
///   started yet makes it finish without running its body
/// - Failures are captured per task and never reach sibling tasks

#pragma once

#include "fwd.hpp"
#include "event.hpp"

#include <vmwarden/core/error.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vmw_async {

// =============================================================================
// Types
// =============================================================================

class TaskCancelled : public std::exception {
public:
    [[nodiscard]] const char* what() const noexcept override { return "task cancelled"; }
};

enum class TaskState : std::uint8_t {
    Pending,    ///< Spawned, body not entered yet
    Running,    ///< Body entered
    Completed,  ///< Body returned normally
    Cancelled,  ///< Ended through cancellation
    Failed,     ///< Body raised an error
};

[[nodiscard]] const char* to_string(TaskState state);

enum class TaskEventType : std::uint8_t {
    Started,
    Completed,
    Cancelled,
    Failed,
};

[[nodiscard]] const char* to_string(TaskEventType type);

struct TaskEvent {
    std::string task_name;
    TaskEventType type;
    std::string message;
};

// =============================================================================
// Task
// =============================================================================

class Task {
public:
    using Body = std::function<boost::asio::awaitable<void>(Task&)>;
    using Clock = std::chrono::steady_clock;

    /// Scoped registration of a cancellation hook
    class CancelHook {
    public:
        CancelHook(Task& task, std::uint64_t id) : m_task(&task), m_id(id) {}
        ~CancelHook();

        CancelHook(CancelHook&& other) noexcept : m_task(other.m_task), m_id(other.m_id) {
            other.m_task = nullptr;
        }

        CancelHook(const CancelHook&) = delete;
        CancelHook& operator=(const CancelHook&) = delete;
        CancelHook& operator=(CancelHook&&) = delete;

    private:
        Task* m_task;
        std::uint64_t m_id;
    };

    Task(std::string name, Body body, boost::asio::any_io_executor executor);

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    [[nodiscard]] const std::string& name() const { return m_name; }
    [[nodiscard]] TaskState state() const { return m_state; }
    [[nodiscard]] bool done() const;
    [[nodiscard]] bool cancel_requested() const { return m_cancel_requested; }
    [[nodiscard]] const std::optional<vmw_core::Error>& failure() const { return m_failure; }
    [[nodiscard]] boost::asio::any_io_executor executor() const { return m_executor; }

    /// Request cancellation (idempotent; no-op once finished)
    void cancel();

    void throw_if_cancelled() const;

    /// Run @p fn if the task is cancelled while the returned hook is alive
    [[nodiscard]] CancelHook on_cancel(std::function<void()> fn);

    /// Cancellation-aware sleep
    boost::asio::awaitable<void> sleep(Clock::duration duration);

    /// Wait until @p other finishes.
    /// Throws TaskCancelled if this task is cancelled or @p other ended cancelled,
    /// and std::runtime_error if @p other failed.
    boost::asio::awaitable<void> join(Task& other);

private:
    friend class TaskGroup;

    std::string m_name;
    Body m_body;
    boost::asio::any_io_executor m_executor;
    TaskState m_state = TaskState::Pending;
    bool m_cancel_requested = false;
    std::optional<vmw_core::Error> m_failure;
    std::map<std::uint64_t, std::function<void()>> m_cancel_hooks;
    std::uint64_t m_next_hook_id = 1;
    OneShotEvent m_finished;
};

// =============================================================================
// TaskGroup
// =============================================================================

class TaskGroup {
public:
    using EventCallback = std::function<void(const TaskEvent&)>;

    explicit TaskGroup(boost::asio::any_io_executor executor);
    ~TaskGroup();

    TaskGroup(const TaskGroup&) = delete;
    TaskGroup& operator=(const TaskGroup&) = delete;

    /// Create a task and schedule it on the group's executor.
    /// The body runs once the executor gets control; until then the task is
    /// Pending and can already be cancelled or joined.
    Task& spawn(std::string name, Task::Body body);

    [[nodiscard]] Task* find(std::string_view name);
    [[nodiscard]] const Task* find(std::string_view name) const;

    /// Get a task that must exist (throws std::out_of_range otherwise)
    [[nodiscard]] Task& get(std::string_view name);

    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] std::size_t size() const { return m_tasks.size(); }

    /// Cancel named tasks; unknown names are ignored
    void cancel(std::string_view name);
    void cancel(std::initializer_list<std::string_view> names);
    void cancel(const std::vector<std::string>& names);

    void cancel_all();
    void cancel_all_except(std::string_view name);

    /// Wait for every task to finish, whatever the outcome. Not cancellable.
    boost::asio::awaitable<void> join_all();

    [[nodiscard]] bool all_done() const;

    /// Errors of tasks that ended in TaskState::Failed, in spawn order
    [[nodiscard]] std::vector<vmw_core::Error> failures() const;

    void set_event_callback(EventCallback callback);

private:
    boost::asio::awaitable<void> run_task(Task& task);
    void finish(Task& task, TaskState state, std::optional<vmw_core::Error> failure);
    void emit_event(const TaskEvent& event);

    boost::asio::any_io_executor m_executor;
    std::vector<std::unique_ptr<Task>> m_tasks;
    EventCallback m_event_callback;
};

} // namespace vmw_async
