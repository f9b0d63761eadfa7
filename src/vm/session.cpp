/// @file session.cpp
/// @brief VmSession implementation

#include <vmwarden/vm/session.hpp>
#include <vmwarden/core/log.hpp>

#include <spdlog/fmt/fmt.h>

namespace vmw_vm {

VmSession::VmSession(VmSpec spec)
    : m_spec(std::move(spec))
{
}

vmw_core::Result<void> VmSession::transition_to(Phase next) {
    if (!is_valid_transition(m_phase, next)) {
        return vmw_core::Err(
            vmw_core::Error(vmw_core::ErrorCode::InvalidState,
                            fmt::format("Invalid phase transition {} -> {}",
                                        to_string(m_phase), to_string(next)))
                .with_context("from", to_string(m_phase))
                .with_context("to", to_string(next)));
    }
    apply(next);
    return vmw_core::Ok();
}

void VmSession::force_off() {
    apply(Phase::Off);
}

void VmSession::apply(Phase next) {
    if (next == m_phase) {
        return;
    }
    Phase previous = m_phase;
    m_phase = next;
    m_history.push_back(next);

    vmw_core::vm_logger()->debug("Phase {} -> {}", to_string(previous), to_string(next));
    if (m_on_phase_change) {
        m_on_phase_change(previous, next);
    }
}

std::string VmSession::summary() const {
    auto optional_text = [](const auto& value) {
        return value ? fmt::format("{}", *value) : std::string("None");
    };

    return fmt::format(
        "<VmSession('{}', mem={}, port={}, pid={}, phase='{}', qmp_established={}, exit_status={})>",
        m_spec.disk_image.string(), m_spec.mem_gb, m_spec.port,
        optional_text(m_pid), to_string(m_phase),
        m_control_established ? "True" : "False",
        optional_text(m_exit_code));
}

} // namespace vmw_vm
