/// @file command.cpp
/// @brief QEMU argument construction

#include <vmwarden/vm/command.hpp>

#include <spdlog/fmt/fmt.h>

#include <unistd.h>

namespace vmw_vm {

LaunchCommand build_qemu_command(const VmSpec& spec, const std::filesystem::path& control_socket) {
    LaunchCommand cmd;
    cmd.program = spec.command;

    auto& args = cmd.args;

    // Machine
    args.push_back("-m"); args.push_back(fmt::format("{}G", spec.mem_gb));
    args.push_back("-hda"); args.push_back(spec.disk_image.string());
    args.push_back("-name"); args.push_back(spec.title());
    args.push_back("-machine"); args.push_back("q35");
    args.push_back("-smp"); args.push_back("2");

    // Headless console
    args.push_back("-vga"); args.push_back("none");
    args.push_back("-nographic");
    args.push_back("-boot"); args.push_back("menu=off");

    // Control socket
    args.push_back("-qmp");
    args.push_back(fmt::format("unix:{},server,nowait", control_socket.string()));

    // Network with guest ssh forwarded to the host loopback
    args.push_back("-device"); args.push_back("e1000,netdev=net0");
    args.push_back("-netdev");
    args.push_back(fmt::format("user,id=net0,hostfwd=tcp:127.0.0.1:{}-:22", spec.port));

    return cmd;
}

std::filesystem::path default_control_socket_path() {
    return std::filesystem::path("/tmp") / fmt::format(".vmwarden_qmp_{}", ::getpid());
}

std::filesystem::path session_log_path(const VmSpec& spec, const std::filesystem::path& directory) {
    return directory / fmt::format("vmwarden_{}.log", spec.title());
}

} // namespace vmw_vm
