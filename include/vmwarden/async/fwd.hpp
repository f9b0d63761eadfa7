/// @file fwd.hpp
/// @brief Forward declarations for vmw_async
///
/// The async module is the coordination substrate for the lifecycle
/// controller: named cooperative tasks on a single-threaded Boost.Asio
/// executor, grouped for joining and cancellation, plus a one-shot
/// broadcast event.

#pragma once

#include <cstdint>

namespace vmw_async {

/// Thrown inside a task at the suspension point where it observes cancellation
class TaskCancelled;

/// Lifecycle of a single task
enum class TaskState : std::uint8_t;

/// A named coroutine with cooperative cancellation
class Task;

/// Owner of a set of named tasks
class TaskGroup;

/// Task lifecycle notification
struct TaskEvent;

/// Set-once, never-reset broadcast event
class OneShotEvent;

} // namespace vmw_async
