// vmw_async Task and TaskGroup tests

#include <catch2/catch_test_macros.hpp>
#include <vmwarden/async/task.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>

#include <chrono>
#include <stdexcept>
#include <string>
#include <vector>

using namespace vmw_async;
namespace asio = boost::asio;
using namespace std::chrono_literals;

TEST_CASE("TaskGroup: task runs to completion", "[async][task]") {
    asio::io_context io;
    TaskGroup group(io.get_executor());

    std::vector<std::string> events;
    group.set_event_callback([&](const TaskEvent& event) {
        events.push_back(event.task_name + ":" + to_string(event.type));
    });

    bool ran = false;
    Task& task = group.spawn("worker", [&](Task&) -> asio::awaitable<void> {
        ran = true;
        co_return;
    });
    REQUIRE(task.state() == TaskState::Pending);

    io.run();

    REQUIRE(ran);
    REQUIRE(task.state() == TaskState::Completed);
    REQUIRE(task.done());
    REQUIRE_FALSE(task.failure().has_value());
    REQUIRE(events == std::vector<std::string>{"worker:started", "worker:completed"});
    REQUIRE(group.all_done());
}

TEST_CASE("TaskGroup: cancel pending task", "[async][task]") {
    asio::io_context io;
    TaskGroup group(io.get_executor());

    std::vector<TaskEventType> events;
    group.set_event_callback([&](const TaskEvent& event) { events.push_back(event.type); });

    bool ran = false;
    group.spawn("never", [&](Task&) -> asio::awaitable<void> {
        ran = true;
        co_return;
    });
    group.cancel("never");
    io.run();

    REQUIRE_FALSE(ran);
    REQUIRE(group.get("never").state() == TaskState::Cancelled);
    REQUIRE(events == std::vector<TaskEventType>{TaskEventType::Cancelled});
}

TEST_CASE("TaskGroup: cancel interrupts sleep", "[async][task]") {
    asio::io_context io;
    TaskGroup group(io.get_executor());

    auto started = std::chrono::steady_clock::now();
    bool after_sleep = false;
    group.spawn("sleeper", [&](Task& task) -> asio::awaitable<void> {
        co_await task.sleep(10s);
        after_sleep = true;
    });
    group.spawn("canceller", [&](Task& task) -> asio::awaitable<void> {
        co_await task.sleep(10ms);
        group.cancel("sleeper");
    });
    io.run();

    REQUIRE_FALSE(after_sleep);
    REQUIRE(group.get("sleeper").state() == TaskState::Cancelled);
    REQUIRE(group.get("canceller").state() == TaskState::Completed);
    REQUIRE(std::chrono::steady_clock::now() - started < 5s);
}

TEST_CASE("TaskGroup: cancelling a finished task is a no-op", "[async][task]") {
    asio::io_context io;
    TaskGroup group(io.get_executor());

    group.spawn("quick", [](Task&) -> asio::awaitable<void> { co_return; });
    io.run();

    group.cancel("quick");
    group.cancel("no_such_task");
    REQUIRE(group.get("quick").state() == TaskState::Completed);
    REQUIRE_FALSE(group.get("quick").cancel_requested());
}

TEST_CASE("TaskGroup: failures are captured per task", "[async][task]") {
    asio::io_context io;
    TaskGroup group(io.get_executor());

    group.spawn("broken", [](Task&) -> asio::awaitable<void> {
        throw std::runtime_error("boom");
        co_return;
    });
    group.spawn("typed", [](Task&) -> asio::awaitable<void> {
        throw vmw_core::ErrorException(vmw_core::ProtocolError::closed("/tmp/qmp"));
        co_return;
    });
    bool sibling_ran = false;
    group.spawn("sibling", [&](Task& task) -> asio::awaitable<void> {
        co_await task.sleep(5ms);
        sibling_ran = true;
    });
    io.run();

    REQUIRE(sibling_ran);
    REQUIRE(group.get("broken").state() == TaskState::Failed);
    REQUIRE(group.get("typed").state() == TaskState::Failed);

    auto failures = group.failures();
    REQUIRE(failures.size() == 2);

    REQUIRE(failures[0].code() == vmw_core::ErrorCode::InternalError);
    REQUIRE(failures[0].message() == "boom");
    REQUIRE(*failures[0].get_context("task") == "broken");
    REQUIRE(failures[0].get_context("type")->find("runtime_error") != std::string::npos);

    REQUIRE(failures[1].code() == vmw_core::ErrorCode::IOError);
    REQUIRE(failures[1].is<vmw_core::ProtocolError>());
    REQUIRE(*failures[1].get_context("task") == "typed");
}

TEST_CASE("TaskGroup: join follows the joined task's outcome", "[async][task]") {
    asio::io_context io;
    TaskGroup group(io.get_executor());

    group.spawn("ok", [](Task& task) -> asio::awaitable<void> { co_await task.sleep(5ms); });
    group.spawn("fails", [](Task& task) -> asio::awaitable<void> {
        co_await task.sleep(5ms);
        throw std::runtime_error("bad");
    });
    group.spawn("cancelled", [](Task& task) -> asio::awaitable<void> { co_await task.sleep(10s); });

    bool joined_ok = false;
    group.spawn("join_ok", [&](Task& task) -> asio::awaitable<void> {
        co_await task.join(group.get("ok"));
        joined_ok = true;
    });
    group.spawn("join_fails", [&](Task& task) -> asio::awaitable<void> {
        co_await task.join(group.get("fails"));
    });
    group.spawn("join_cancelled", [&](Task& task) -> asio::awaitable<void> {
        co_await task.join(group.get("cancelled"));
    });
    group.spawn("canceller", [&](Task& task) -> asio::awaitable<void> {
        co_await task.sleep(10ms);
        group.cancel("cancelled");
    });
    io.run();

    REQUIRE(joined_ok);
    REQUIRE(group.get("join_fails").state() == TaskState::Failed);
    REQUIRE(group.get("join_fails").failure()->message().find("Task 'fails' failed") != std::string::npos);
    REQUIRE(group.get("join_cancelled").state() == TaskState::Cancelled);
}

TEST_CASE("TaskGroup: cancel_all_except spares one task", "[async][task]") {
    asio::io_context io;
    TaskGroup group(io.get_executor());

    for (const char* name : {"process", "probe", "progress"}) {
        group.spawn(name, [](Task& task) -> asio::awaitable<void> { co_await task.sleep(50ms); });
    }
    group.cancel_all_except("process");
    io.run();

    REQUIRE(group.get("process").state() == TaskState::Completed);
    REQUIRE(group.get("probe").state() == TaskState::Cancelled);
    REQUIRE(group.get("progress").state() == TaskState::Cancelled);
}

TEST_CASE("TaskGroup: join_all waits for every task", "[async][task]") {
    asio::io_context io;
    TaskGroup group(io.get_executor());

    group.spawn("short", [](Task& task) -> asio::awaitable<void> { co_await task.sleep(5ms); });
    group.spawn("long", [](Task& task) -> asio::awaitable<void> { co_await task.sleep(20ms); });
    group.spawn("fails", [](Task&) -> asio::awaitable<void> {
        throw std::runtime_error("x");
        co_return;
    });

    bool all_done_after_join = false;
    asio::co_spawn(io, [&]() -> asio::awaitable<void> {
        co_await group.join_all();
        all_done_after_join = group.all_done();
    }, asio::detached);
    io.run();

    REQUIRE(all_done_after_join);
    REQUIRE(group.names() == std::vector<std::string>{"short", "long", "fails"});
}

TEST_CASE("TaskGroup: lookup", "[async][task]") {
    asio::io_context io;
    TaskGroup group(io.get_executor());
    group.spawn("one", [](Task&) -> asio::awaitable<void> { co_return; });

    REQUIRE(group.size() == 1);
    REQUIRE(group.find("one") != nullptr);
    REQUIRE(group.find("two") == nullptr);
    REQUIRE_THROWS_AS(group.get("two"), std::out_of_range);

    io.run();
}

TEST_CASE("Task: cancel hooks run once and unregister", "[async][task]") {
    asio::io_context io;
    TaskGroup group(io.get_executor());

    int scoped_calls = 0;
    int released_calls = 0;
    group.spawn("hooks", [&](Task& task) -> asio::awaitable<void> {
        {
            auto released = task.on_cancel([&] { ++released_calls; });
        }
        auto scoped = task.on_cancel([&] { ++scoped_calls; });
        task.cancel();
        task.cancel();
        task.throw_if_cancelled();
        co_return;
    });
    io.run();

    REQUIRE(scoped_calls == 1);
    REQUIRE(released_calls == 0);
    REQUIRE(group.get("hooks").state() == TaskState::Cancelled);
}
