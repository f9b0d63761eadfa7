/// @file session.hpp
/// @brief State of one supervised VM run
///
/// The session is the single owner of the lifecycle phase. Every lifecycle
/// task holds a reference to it and writes only the fields it is responsible
/// for; all access happens on the controller's executor, so no locking.

#pragma once

#include "types.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace vmw_vm {

class VmSession {
public:
    using PhaseCallback = std::function<void(Phase from, Phase to)>;

    explicit VmSession(VmSpec spec);

    [[nodiscard]] const VmSpec& spec() const { return m_spec; }

    // =========================================================================
    // Phase
    // =========================================================================

    [[nodiscard]] Phase phase() const { return m_phase; }

    /// Move to @p next; rejects transitions outside the lifecycle graph
    vmw_core::Result<void> transition_to(Phase next);

    /// Move to Off from any phase
    void force_off();

    /// Every phase the session has been in, starting with Off
    [[nodiscard]] const std::vector<Phase>& history() const { return m_history; }

    void set_phase_callback(PhaseCallback callback) { m_on_phase_change = std::move(callback); }

    // =========================================================================
    // Process facts
    // =========================================================================

    [[nodiscard]] const std::optional<pid_t>& pid() const { return m_pid; }
    void set_pid(pid_t pid) { m_pid = pid; }

    [[nodiscard]] const std::optional<int>& exit_code() const { return m_exit_code; }
    void set_exit_code(int code) { m_exit_code = code; }

    [[nodiscard]] bool memory_failure() const { return m_memory_failure; }
    void set_memory_failure(bool value) { m_memory_failure = value; }

    [[nodiscard]] bool control_established() const { return m_control_established; }
    void set_control_established(bool value) { m_control_established = value; }

    /// One-line description for the session log
    [[nodiscard]] std::string summary() const;

private:
    void apply(Phase next);

    VmSpec m_spec;
    Phase m_phase = Phase::Off;
    std::vector<Phase> m_history{Phase::Off};
    PhaseCallback m_on_phase_change;

    std::optional<pid_t> m_pid;
    std::optional<int> m_exit_code;
    bool m_memory_failure = false;
    bool m_control_established = false;
};

} // namespace vmw_vm
