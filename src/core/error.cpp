/// @file error.cpp
/// @brief Error formatting for vmw_core
///
/// The error system is template-based and header-only. This file provides
/// the detailed formatting used when errors are written to the session log
/// and explicit instantiations of the common Result types.

#include <vmwarden/core/error.hpp>
#include <sstream>
#include <vector>

namespace vmw_core {

namespace detail {

std::string format_process_error(const ProcessError& err) {
    std::ostringstream oss;
    oss << "[ProcessError] " << err.message;

    if (!err.program.empty()) {
        oss << " (program: " << err.program << ")";
    }
    if (err.os_error != 0) {
        oss << " (errno: " << err.os_error << ")";
    }

    return oss.str();
}

std::string format_protocol_error(const ProtocolError& err) {
    std::ostringstream oss;
    oss << "[ProtocolError] " << err.message;

    if (!err.reply.empty()) {
        oss << " (reply: " << err.reply << ")";
    }

    return oss.str();
}

std::string format_config_error(const ConfigError& err) {
    std::ostringstream oss;
    oss << "[ConfigError] " << err.message;

    if (!err.path.empty()) {
        oss << " (file: " << err.path << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ProcessError>) {
            oss << detail::format_process_error(err);
        } else if constexpr (std::is_same_v<T, ProtocolError>) {
            oss << detail::format_protocol_error(err);
        } else if constexpr (std::is_same_v<T, ConfigError>) {
            oss << detail::format_config_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n    " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<int, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::string>, Error>;

} // namespace vmw_core
