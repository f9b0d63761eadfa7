// vmw_vm Controller end-to-end tests
//
// A shell script stands in for QEMU, FakeSshServer for the guest ssh service
// and FakeQmpServer for the QMP socket. Timings are scaled down.

#include <catch2/catch_test_macros.hpp>
#include <vmwarden/vm/controller.hpp>

#include "support/test_support.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <sstream>
#include <string>
#include <sys/wait.h>
#include <vector>

using namespace vmw_vm;
using vmw_test::FakeQmpServer;
using vmw_test::FakeSshServer;
using vmw_test::TempDir;
using namespace std::chrono_literals;

namespace {

SessionConfig fast_config(const TempDir& dir) {
    return SessionConfig{}
        .with_probe_interval(20ms)
        .with_progress_interval(20ms)
        .with_boot_timeout(5s)
        .with_shutdown_timeout(5s)
        .with_log_directory(dir.path())
        .with_control_socket(dir / "qmp.sock")
        .with_flush_log(true);
}

/// Script that exits with 0 once @p flag exists (gives up with 5 after ~10s)
LaunchCommand exit_on_flag(const TempDir& dir, const std::filesystem::path& flag) {
    auto script = vmw_test::write_script(dir / "fake-qemu.sh",
        "i=0\n"
        "while [ ! -e '" + flag.string() + "' ]; do\n"
        "    i=$((i + 1))\n"
        "    [ $i -gt 200 ] && exit 5\n"
        "    sleep 0.05\n"
        "done\n"
        "exit 0");
    return LaunchCommand{script.string(), {}};
}

LaunchCommand script(const TempDir& dir, const std::string& body) {
    return LaunchCommand{vmw_test::write_script(dir / "fake-qemu.sh", body).string(), {}};
}

struct Streams {
    std::ostringstream out;
    std::ostringstream err;
};

void reap(pid_t pid) {
    ::kill(-pid, SIGKILL);
    int status = 0;
    ::waitpid(pid, &status, 0);
}

} // anonymous namespace

TEST_CASE("Controller: boot, graceful shutdown, clean exit", "[vm][controller]") {
    TempDir dir;
    auto flag = dir / "powered-down";

    FakeSshServer ssh(2);
    FakeQmpServer::Script qmp_script;
    qmp_script.on_powerdown = [flag] { vmw_test::touch(flag); };
    FakeQmpServer qmp(dir / "qmp.sock", qmp_script);

    Controller controller(VmSpec{dir / "dev.qcow2", "qemu", 2.0, ssh.port()}, fast_config(dir));
    Streams streams;
    controller.set_output(streams.out, streams.err);
    controller.set_launch_command(exit_on_flag(dir, flag));

    // Repeated requests behave like one
    controller.set_on_phase_change([&](Phase, Phase to) {
        if (to == Phase::Running) {
            controller.request_shutdown();
            controller.request_shutdown();
            controller.request_shutdown();
        }
    });

    std::vector<std::string> events;
    controller.set_on_task_event([&](const vmw_async::TaskEvent& event) {
        events.push_back(event.task_name + ":" + vmw_async::to_string(event.type));
    });

    auto result = controller.run();
    REQUIRE(result);

    REQUIRE(result->final_phase == Phase::Off);
    REQUIRE(result->exit_code == 0);
    REQUIRE(result->succeeded());
    REQUIRE(result->pid.has_value());
    REQUIRE_FALSE(result->memory_failure);
    REQUIRE(result->control_established);
    REQUIRE(result->timeout == TimeoutKind::None);
    REQUIRE(result->task_errors.empty());
    REQUIRE(result->log_path == dir / "vmwarden_dev.log");

    REQUIRE(controller.session().history() == std::vector<Phase>{
        Phase::Off, Phase::Booting, Phase::Running, Phase::ShuttingDown, Phase::Off});
    REQUIRE(ssh.connections() == 3);
    REQUIRE(qmp.powerdowns() == 1);
    REQUIRE(controller.shutdown_requested());

    auto out = streams.out.str();
    REQUIRE(out.find("\nShutdown requested\n") != std::string::npos);
    REQUIRE(out.front() == 'b');
    REQUIRE(streams.err.str().empty());

    auto log = vmw_test::read_file(result->log_path);
    REQUIRE(log.find("Starting event loop") != std::string::npos);
    REQUIRE(log.find("Subprocess Id " + std::to_string(*result->pid)) != std::string::npos);
    REQUIRE(log.find("Established QMP connection") != std::string::npos);
    REQUIRE(log.find("Sent system_powerdown command") != std::string::npos);
    REQUIRE(log.find("\"event\":\"SHUTDOWN\"") != std::string::npos);
    REQUIRE(log.find("phase='off', qmp_established=True, exit_status=0)>") != std::string::npos);
    REQUIRE(log.find("Errors were produced") == std::string::npos);

    for (const char* name : {task_names::kProcess, task_names::kBootProbe, task_names::kShutdown}) {
        REQUIRE(std::find(events.begin(), events.end(), std::string(name) + ":completed") != events.end());
    }
    REQUIRE(std::find(events.begin(), events.end(), "boot_watchdog:cancelled") != events.end());
    REQUIRE(std::find(events.begin(), events.end(), "shutdown_watchdog:cancelled") != events.end());
}

TEST_CASE("Controller: SIGINT requests shutdown", "[vm][controller]") {
    TempDir dir;
    auto flag = dir / "powered-down";

    FakeSshServer ssh;
    FakeQmpServer::Script qmp_script;
    qmp_script.on_powerdown = [flag] { vmw_test::touch(flag); };
    FakeQmpServer qmp(dir / "qmp.sock", qmp_script);

    Controller controller(VmSpec{dir / "dev.qcow2", "qemu", 1.0, ssh.port()}, fast_config(dir));
    Streams streams;
    controller.set_output(streams.out, streams.err);
    controller.set_launch_command(exit_on_flag(dir, flag));
    controller.set_on_phase_change([](Phase, Phase to) {
        if (to == Phase::Running) {
            std::raise(SIGINT);
            std::raise(SIGINT);
        }
    });

    auto result = controller.run();
    REQUIRE(result);
    REQUIRE(result->exit_code == 0);
    REQUIRE(qmp.powerdowns() == 1);
    REQUIRE(controller.shutdown_requested());
}

TEST_CASE("Controller: boot timeout", "[vm][controller][timeout]") {
    TempDir dir;
    auto port = vmw_test::unused_port();
    auto config = fast_config(dir).with_boot_timeout(200ms);

    SECTION("abandon leaves the process running") {
        Controller controller(VmSpec{dir / "dev.qcow2", "qemu", 1.0, port},
                              config.with_timeout_policy(TimeoutPolicy::Abandon));
        Streams streams;
        controller.set_output(streams.out, streams.err);
        controller.set_launch_command(script(dir, "exec sleep 30"));

        auto started_at = std::chrono::steady_clock::now();
        auto result = controller.run();
        REQUIRE(result);
        REQUIRE(std::chrono::steady_clock::now() - started_at >= 200ms);
        REQUIRE(result->final_phase == Phase::Off);
        REQUIRE(result->timeout == TimeoutKind::Boot);
        REQUIRE(controller.session().history() == std::vector<Phase>{Phase::Off, Phase::Booting, Phase::Off});
        REQUIRE(result->pid.has_value());
        REQUIRE_FALSE(result->exit_code.has_value());
        REQUIRE(result->process_exit_status() == 1);
        REQUIRE(streams.err.str().find("\nTimed out.\n") != std::string::npos);
        REQUIRE(result->task_errors.empty());

        reap(*result->pid);
    }

    SECTION("kill terminates the process") {
        Controller controller(VmSpec{dir / "dev.qcow2", "qemu", 1.0, port},
                              config.with_timeout_policy(TimeoutPolicy::Kill));
        Streams streams;
        controller.set_output(streams.out, streams.err);
        controller.set_launch_command(script(dir, "exec sleep 30"));

        auto result = controller.run();
        REQUIRE(result);
        REQUIRE(result->final_phase == Phase::Off);
        REQUIRE(result->timeout == TimeoutKind::Boot);
        REQUIRE(result->exit_code == -SIGKILL);
        REQUIRE(controller.session().history() == std::vector<Phase>{Phase::Off, Phase::Booting, Phase::Off});
        REQUIRE(streams.err.str().find("\nTimed out.\n") != std::string::npos);

        auto log = vmw_test::read_file(result->log_path);
        REQUIRE(log.find("Boot timed out") != std::string::npos);
    }
}

TEST_CASE("Controller: shutdown timeout", "[vm][controller][timeout]") {
    TempDir dir;
    FakeSshServer ssh;

    // Acknowledges the power-down but the guest never goes down
    FakeQmpServer::Script qmp_script;
    qmp_script.after_powerdown = {R"({"return": {}})"};
    FakeQmpServer qmp(dir / "qmp.sock", qmp_script);

    auto config = fast_config(dir)
        .with_shutdown_timeout(200ms)
        .with_timeout_policy(TimeoutPolicy::Kill);
    Controller controller(VmSpec{dir / "dev.qcow2", "qemu", 1.0, ssh.port()}, config);
    Streams streams;
    controller.set_output(streams.out, streams.err);
    controller.set_launch_command(script(dir, "exec sleep 30"));
    controller.set_on_phase_change([&](Phase, Phase to) {
        if (to == Phase::Running) {
            controller.request_shutdown();
        }
    });

    auto result = controller.run();
    REQUIRE(result);
    REQUIRE(result->timeout == TimeoutKind::Shutdown);
    REQUIRE(result->exit_code == -SIGKILL);
    REQUIRE(result->control_established);
    REQUIRE(qmp.powerdowns() == 1);
    REQUIRE(streams.err.str().find("\nShut down timed out.\n") != std::string::npos);
    REQUIRE(controller.session().history() == std::vector<Phase>{
        Phase::Off, Phase::Booting, Phase::Running, Phase::ShuttingDown, Phase::Off});
}

TEST_CASE("Controller: memory allocation failure", "[vm][controller]") {
    TempDir dir;
    Controller controller(VmSpec{dir / "big.qcow2", "qemu", 64.0, vmw_test::unused_port()},
                          fast_config(dir));
    Streams streams;
    controller.set_output(streams.out, streams.err);
    controller.set_launch_command(script(dir,
        "echo \"qemu-system-x86_64: cannot set up guest memory 'pc.ram': Cannot allocate memory\" >&2\n"
        "exit 1"));

    auto result = controller.run();
    REQUIRE(result);
    REQUIRE(result->exit_code == 1);
    REQUIRE(result->memory_failure);
    REQUIRE(result->final_phase == Phase::Off);
    REQUIRE(result->timeout == TimeoutKind::None);
    REQUIRE(result->task_errors.empty());
}

TEST_CASE("Controller: control socket failure is reported, not fatal", "[vm][controller]") {
    TempDir dir;
    FakeSshServer ssh;

    Controller controller(VmSpec{dir / "dev.qcow2", "qemu", 1.0, ssh.port()}, fast_config(dir));
    Streams streams;
    controller.set_output(streams.out, streams.err);
    controller.set_launch_command(script(dir, "sleep 1\nexit 0"));

    auto result = controller.run();
    REQUIRE(result);
    REQUIRE(result->exit_code == 0);
    REQUIRE_FALSE(result->control_established);

    REQUIRE(result->task_errors.size() == 1);
    const auto& error = result->task_errors.front();
    REQUIRE(error.code() == vmw_core::ErrorCode::IOError);
    REQUIRE(*error.get_context("task") == task_names::kShutdown);

    auto log = vmw_test::read_file(result->log_path);
    REQUIRE(log.find(std::string(78, '-') + "\nErrors were produced while running the control script:\n")
            != std::string::npos);
    REQUIRE(log.find("[IOError] [ProtocolError] Cannot connect to") != std::string::npos);
}

TEST_CASE("Controller: hypervisor that cannot be started", "[vm][controller]") {
    TempDir dir;
    Controller controller(VmSpec{dir / "dev.qcow2", "qemu", 1.0, vmw_test::unused_port()},
                          fast_config(dir));
    Streams streams;
    controller.set_output(streams.out, streams.err);
    controller.set_launch_command(LaunchCommand{"/nonexistent/qemu-system-x86_64", {}});

    auto result = controller.run();
    REQUIRE(result);
    REQUIRE_FALSE(result->pid.has_value());
    REQUIRE_FALSE(result->exit_code.has_value());
    REQUIRE(result->final_phase == Phase::Off);
    REQUIRE(result->task_errors.size() == 1);
    REQUIRE(result->task_errors.front().code() == vmw_core::ErrorCode::SpawnFailed);
}

TEST_CASE("Controller: runs only once", "[vm][controller]") {
    TempDir dir;
    Controller controller(VmSpec{dir / "dev.qcow2", "qemu", 1.0, vmw_test::unused_port()},
                          fast_config(dir));
    Streams streams;
    controller.set_output(streams.out, streams.err);
    controller.set_launch_command(script(dir, "exit 0"));

    REQUIRE(controller.run());
    auto again = controller.run();
    REQUIRE_FALSE(again);
    REQUIRE(again.error().code() == vmw_core::ErrorCode::InvalidState);
}

TEST_CASE("Controller: unwritable log directory", "[vm][controller]") {
    TempDir dir;
    vmw_test::touch(dir / "not-a-dir");
    auto config = fast_config(dir).with_log_directory(dir / "not-a-dir");

    Controller controller(VmSpec{dir / "dev.qcow2"}, config);
    REQUIRE(controller.log_path() == dir / "not-a-dir" / "vmwarden_dev.log");

    auto result = controller.run();
    REQUIRE_FALSE(result);
    REQUIRE(result.error().code() == vmw_core::ErrorCode::IOError);
    REQUIRE(controller.session().phase() == Phase::Off);
}
