/// @file context.hpp
/// @brief Shared state handed to every lifecycle component

#pragma once

#include "fwd.hpp"

#include <vmwarden/async/fwd.hpp>
#include <vmwarden/core/fwd.hpp>

#include <iosfwd>

namespace vmw_vm {

/// References owned by the Controller for the duration of one run
struct LifecycleContext {
    VmSession& session;
    vmw_core::SessionLog& log;
    vmw_async::TaskGroup& tasks;
    vmw_async::OneShotEvent& shutdown_requested;
    const SessionConfig& config;
    std::ostream& out;      ///< Interactive progress output
    std::ostream& err;      ///< Diagnostics meant for the user
};

} // namespace vmw_vm
