/// @file fwd.hpp
/// @brief Forward declarations for vmw_vm

#pragma once

#include <cstdint>

namespace vmw_vm {

// Types
enum class Phase : std::uint8_t;
enum class TimeoutPolicy : std::uint8_t;
enum class TimeoutKind : std::uint8_t;
struct VmSpec;
struct LaunchCommand;
struct SessionConfig;
struct RunResult;

// Session state
class VmSession;

// Lifecycle components
struct LifecycleContext;
class ProcessSupervisor;
class BootProbe;
class ShutdownNegotiator;
class BootWatchdog;
class ShutdownWatchdog;
class ProgressReporter;
class Controller;

} // namespace vmw_vm
