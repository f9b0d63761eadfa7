/// @file command.hpp
/// @brief Hypervisor command line and per-session paths

#pragma once

#include "types.hpp"

#include <filesystem>

namespace vmw_vm {

/// Build the QEMU invocation for @p spec with a QMP server on @p control_socket
[[nodiscard]] LaunchCommand build_qemu_command(const VmSpec& spec,
                                               const std::filesystem::path& control_socket);

/// `/tmp/.vmwarden_qmp_<pid>` for the calling process
[[nodiscard]] std::filesystem::path default_control_socket_path();

/// `<directory>/vmwarden_<title>.log`
[[nodiscard]] std::filesystem::path session_log_path(const VmSpec& spec,
                                                     const std::filesystem::path& directory);

} // namespace vmw_vm
