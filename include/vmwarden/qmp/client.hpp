#pragma once

/// @file client.hpp
/// @brief QMP (QEMU Machine Protocol) client over a local stream socket
///
/// Wire format is newline-delimited JSON:
/// 1. Server sends a greeting line
/// 2. Client sends `{"execute": "qmp_capabilities"}` + CRLF
/// 3. Server answers `{"return": {}}` when command mode is entered
/// 4. Commands and asynchronous events follow, one JSON object per line
///
/// All operations run inside a vmw_async::Task and are interrupted by its
/// cancellation. Failures are thrown as QmpError.

#include <vmwarden/core/error.hpp>
#include <vmwarden/async/task.hpp>

#include <boost/asio/any_io_executor.hpp>
#include <utility>  // Boost 1.74 awaitable.hpp uses std::exchange without including it
#include <boost/asio/awaitable.hpp>
#include <boost/asio/local/stream_protocol.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace vmw_qmp {

/// Command that switches the server from capabilities negotiation to command mode
inline constexpr const char* kCapabilitiesCommand = "qmp_capabilities";

/// Command asking the guest for an ACPI power-down
inline constexpr const char* kPowerdownCommand = "system_powerdown";

/// Event emitted once the guest has shut down
inline constexpr const char* kShutdownEvent = "SHUTDOWN";

/// Longest line accepted from the server, terminator included
inline constexpr std::size_t kMaxLineLength = 64 * 1024;

// =============================================================================
// QmpError
// =============================================================================

/// Protocol or transport failure on the control socket
class QmpError : public vmw_core::ErrorException {
public:
    explicit QmpError(vmw_core::ProtocolError detail)
        : vmw_core::ErrorException(vmw_core::Error(std::move(detail)))
    {}

    [[nodiscard]] const vmw_core::ProtocolError& detail() const {
        return *error().as<vmw_core::ProtocolError>();
    }
};

// =============================================================================
// Message helpers
// =============================================================================

/// Format a command line exactly as sent on the wire (CRLF terminated)
[[nodiscard]] std::string format_command(std::string_view command);

/// True if @p message is `{"return": {}}` (possibly with other keys)
[[nodiscard]] bool is_empty_return(const nlohmann::json& message);

/// True if @p message is an event named @p name
[[nodiscard]] bool is_event(const nlohmann::json& message, std::string_view name);

// =============================================================================
// QmpClient
// =============================================================================

class QmpClient {
public:
    QmpClient(boost::asio::any_io_executor executor, std::filesystem::path socket_path);
    ~QmpClient();

    QmpClient(const QmpClient&) = delete;
    QmpClient& operator=(const QmpClient&) = delete;

    /// Connect to the control socket
    boost::asio::awaitable<void> connect(vmw_async::Task& task);

    /// Consume the greeting and enter command mode.
    /// Throws QmpError if the server does not answer with an empty return.
    boost::asio::awaitable<void> negotiate(vmw_async::Task& task);

    /// Send a command without waiting for its reply
    boost::asio::awaitable<void> send_command(vmw_async::Task& task, std::string_view command);

    /// Read one raw line (terminator stripped)
    boost::asio::awaitable<std::string> read_line(vmw_async::Task& task);

    /// Read and parse one JSON message
    boost::asio::awaitable<nlohmann::json> read_message(vmw_async::Task& task);

    /// Read messages until the named event arrives; other lines are skipped.
    /// Returns the event message.
    boost::asio::awaitable<nlohmann::json> wait_for_event(vmw_async::Task& task, std::string_view name);

    void close();

    [[nodiscard]] bool is_open() const { return m_socket.is_open(); }
    [[nodiscard]] bool negotiated() const { return m_negotiated; }
    [[nodiscard]] std::size_t commands_sent() const { return m_commands_sent; }
    [[nodiscard]] const std::filesystem::path& socket_path() const { return m_socket_path; }
    [[nodiscard]] const std::string& greeting() const { return m_greeting; }

private:
    [[noreturn]] void fail_io(vmw_async::Task& task, const boost::system::error_code& ec);

    std::filesystem::path m_socket_path;
    std::string m_endpoint;
    boost::asio::local::stream_protocol::socket m_socket;
    std::string m_buffer;
    std::string m_greeting;
    bool m_negotiated = false;
    std::size_t m_commands_sent = 0;
};

} // namespace vmw_qmp
