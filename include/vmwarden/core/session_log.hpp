#pragma once

/// @file session_log.hpp
/// @brief Per-VM session log file
///
/// The session log is shared between vmwarden (text lines) and the
/// hypervisor process (raw output through an inherited file descriptor).
/// It is always opened in append mode so that neither writer overwrites the
/// other. Text lines carry a local `HH:MM:SS` prefix unless written plain.

#include "error.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>
#include <string_view>

namespace vmw_core {

/// Options controlling how a session log is opened
struct SessionLogOptions {
    bool recreate = true;      ///< Delete any previous log before opening
    bool flush_each = false;   ///< Flush after every line
};

class SessionLog {
public:
    /// Open (and optionally recreate) the log at @p path
    [[nodiscard]] static Result<std::unique_ptr<SessionLog>> open(
        const std::filesystem::path& path, SessionLogOptions options = {});

    ~SessionLog();

    SessionLog(const SessionLog&) = delete;
    SessionLog& operator=(const SessionLog&) = delete;

    /// Write a timestamped line
    void line(std::string_view message);

    /// Write a line without timestamp (blank lines, separators, reports)
    void plain(std::string_view message);

    void flush();

    [[nodiscard]] const std::filesystem::path& path() const { return m_path; }

private:
    SessionLog(std::filesystem::path path,
               std::shared_ptr<spdlog::logger> stamped,
               std::shared_ptr<spdlog::logger> plain);

    std::filesystem::path m_path;
    std::shared_ptr<spdlog::logger> m_stamped;
    std::shared_ptr<spdlog::logger> m_plain;
};

} // namespace vmw_core
