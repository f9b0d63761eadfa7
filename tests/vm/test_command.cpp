// vmw_vm hypervisor command line tests

#include <catch2/catch_test_macros.hpp>
#include <vmwarden/vm/command.hpp>

#include <algorithm>
#include <iterator>
#include <string>
#include <unistd.h>
#include <vector>

using namespace vmw_vm;

namespace {

/// Value following @p flag, or empty
std::string arg_after(const LaunchCommand& cmd, const std::string& flag) {
    auto it = std::find(cmd.args.begin(), cmd.args.end(), flag);
    if (it == cmd.args.end() || std::next(it) == cmd.args.end()) {
        return {};
    }
    return *std::next(it);
}

} // anonymous namespace

TEST_CASE("VmSpec: title is the image stem", "[vm][command]") {
    REQUIRE(VmSpec{"/var/vms/ubuntu-22.04.qcow2"}.title() == "ubuntu-22.04");
    REQUIRE(VmSpec{"disk.img"}.title() == "disk");
    REQUIRE(VmSpec{"raw"}.title() == "raw");
}

TEST_CASE("build_qemu_command: arguments", "[vm][command]") {
    VmSpec spec{"/var/vms/dev.qcow2", "qemu-system-x86_64", 3.0, 2222};
    auto cmd = build_qemu_command(spec, "/tmp/.vmwarden_qmp_77");

    REQUIRE(cmd.program == "qemu-system-x86_64");
    REQUIRE(arg_after(cmd, "-m") == "3G");
    REQUIRE(arg_after(cmd, "-hda") == "/var/vms/dev.qcow2");
    REQUIRE(arg_after(cmd, "-name") == "dev");
    REQUIRE(arg_after(cmd, "-machine") == "q35");
    REQUIRE(arg_after(cmd, "-vga") == "none");
    REQUIRE(arg_after(cmd, "-qmp") == "unix:/tmp/.vmwarden_qmp_77,server,nowait");
    REQUIRE(arg_after(cmd, "-device") == "e1000,netdev=net0");
    REQUIRE(arg_after(cmd, "-netdev") == "user,id=net0,hostfwd=tcp:127.0.0.1:2222-:22");
    REQUIRE(std::find(cmd.args.begin(), cmd.args.end(), "-nographic") != cmd.args.end());
}

TEST_CASE("build_qemu_command: fractional memory and custom binary", "[vm][command]") {
    VmSpec spec{"/vms/small.img", "/opt/qemu/bin/qemu-system-aarch64", 0.5, 2022};
    auto cmd = build_qemu_command(spec, "/tmp/q");

    REQUIRE(cmd.program == "/opt/qemu/bin/qemu-system-aarch64");
    REQUIRE(arg_after(cmd, "-m") == "0.5G");
    REQUIRE(arg_after(cmd, "-netdev") == "user,id=net0,hostfwd=tcp:127.0.0.1:2022-:22");
}

TEST_CASE("LaunchCommand: log rendering quotes spaces", "[vm][command]") {
    LaunchCommand cmd{"qemu", {"-hda", "/my vms/a.img", "-nographic"}};
    REQUIRE(cmd.to_string() == "qemu -hda \"/my vms/a.img\" -nographic");
}

TEST_CASE("Per-session paths", "[vm][command]") {
    REQUIRE(default_control_socket_path() ==
            std::filesystem::path("/tmp/.vmwarden_qmp_" + std::to_string(::getpid())));
    REQUIRE(session_log_path(VmSpec{"/vms/dev.qcow2"}, "/var/log") ==
            std::filesystem::path("/var/log/vmwarden_dev.log"));
}
