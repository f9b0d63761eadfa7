/// @file client.cpp
/// @brief QMP client implementation

#include <vmwarden/qmp/client.hpp>
#include <vmwarden/core/log.hpp>

#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <spdlog/fmt/fmt.h>

namespace vmw_qmp {

namespace asio = boost::asio;
using stream_protocol = asio::local::stream_protocol;

// =============================================================================
// Message helpers
// =============================================================================

std::string format_command(std::string_view command) {
    return fmt::format("{{\"execute\": \"{}\"}}\r\n", command);
}

bool is_empty_return(const nlohmann::json& message) {
    if (!message.is_object()) {
        return false;
    }
    auto it = message.find("return");
    return it != message.end() && it->is_object() && it->empty();
}

bool is_event(const nlohmann::json& message, std::string_view name) {
    if (!message.is_object()) {
        return false;
    }
    auto it = message.find("event");
    return it != message.end() && it->is_string() && it->get<std::string>() == name;
}

// =============================================================================
// QmpClient
// =============================================================================

QmpClient::QmpClient(asio::any_io_executor executor, std::filesystem::path socket_path)
    : m_socket_path(std::move(socket_path))
    , m_endpoint(m_socket_path.string())
    , m_socket(executor)
{
}

QmpClient::~QmpClient() {
    close();
}

void QmpClient::close() {
    if (!m_socket.is_open()) {
        return;
    }
    boost::system::error_code ec;
    m_socket.shutdown(stream_protocol::socket::shutdown_both, ec);
    m_socket.close(ec);
    if (ec) {
        vmw_core::qmp_logger()->debug("Closing {} reported: {}", m_endpoint, ec.message());
    }
}

asio::awaitable<void> QmpClient::connect(vmw_async::Task& task) {
    task.throw_if_cancelled();

    stream_protocol::endpoint endpoint;
    try {
        endpoint = stream_protocol::endpoint(m_endpoint);
    } catch (const boost::system::system_error& e) {
        throw QmpError(vmw_core::ProtocolError::connect_failed(m_endpoint, e.code().message()));
    }

    auto hook = task.on_cancel([this] { close(); });

    boost::system::error_code ec;
    co_await m_socket.async_connect(endpoint, asio::redirect_error(asio::use_awaitable, ec));
    task.throw_if_cancelled();
    if (ec) {
        close();
        throw QmpError(vmw_core::ProtocolError::connect_failed(m_endpoint, ec.message()));
    }

    vmw_core::qmp_logger()->debug("Connected to {}", m_endpoint);
}

asio::awaitable<void> QmpClient::negotiate(vmw_async::Task& task) {
    m_greeting = co_await read_line(task);
    vmw_core::qmp_logger()->debug("Greeting: {}", m_greeting);

    co_await send_command(task, kCapabilitiesCommand);

    nlohmann::json reply = co_await read_message(task);
    if (!is_empty_return(reply)) {
        throw QmpError(vmw_core::ProtocolError::unexpected_reply(m_endpoint, reply.dump()));
    }
    m_negotiated = true;
}

asio::awaitable<void> QmpClient::send_command(vmw_async::Task& task, std::string_view command) {
    task.throw_if_cancelled();

    std::string line = format_command(command);
    auto hook = task.on_cancel([this] { close(); });

    boost::system::error_code ec;
    co_await asio::async_write(m_socket, asio::buffer(line),
                               asio::redirect_error(asio::use_awaitable, ec));
    if (ec) {
        fail_io(task, ec);
    }
    task.throw_if_cancelled();

    ++m_commands_sent;
    vmw_core::qmp_logger()->debug("Sent {}", vmw_core::escape_bytes(line));
}

asio::awaitable<std::string> QmpClient::read_line(vmw_async::Task& task) {
    task.throw_if_cancelled();

    auto hook = task.on_cancel([this] { close(); });

    boost::system::error_code ec;
    std::size_t n = co_await asio::async_read_until(
        m_socket, asio::dynamic_buffer(m_buffer, kMaxLineLength), '\n',
        asio::redirect_error(asio::use_awaitable, ec));
    if (ec == asio::error::not_found) {
        task.throw_if_cancelled();
        throw QmpError(vmw_core::ProtocolError::line_too_long(m_endpoint, kMaxLineLength));
    }
    if (ec) {
        fail_io(task, ec);
    }
    task.throw_if_cancelled();

    std::string line = m_buffer.substr(0, n);
    m_buffer.erase(0, n);
    while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) {
        line.pop_back();
    }
    co_return line;
}

asio::awaitable<nlohmann::json> QmpClient::read_message(vmw_async::Task& task) {
    std::string line = co_await read_line(task);

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::parse_error& e) {
        vmw_core::qmp_logger()->debug("Unparsable line {}: {}", vmw_core::escape_bytes(line), e.what());
        throw QmpError(vmw_core::ProtocolError::malformed(m_endpoint, line));
    }
    vmw_core::qmp_logger()->trace("Received {}", line);
    co_return message;
}

asio::awaitable<nlohmann::json> QmpClient::wait_for_event(vmw_async::Task& task, std::string_view name) {
    for (;;) {
        nlohmann::json message = co_await read_message(task);
        if (is_event(message, name)) {
            co_return message;
        }
        vmw_core::qmp_logger()->debug("Ignoring {} while waiting for {}", message.dump(), name);
    }
}

void QmpClient::fail_io(vmw_async::Task& task, const boost::system::error_code& ec) {
    task.throw_if_cancelled();
    if (ec == asio::error::eof) {
        throw QmpError(vmw_core::ProtocolError::closed(m_endpoint));
    }
    throw QmpError(vmw_core::ProtocolError{
        vmw_core::ProtocolError::Kind::Closed,
        "I/O error on " + m_endpoint + ": " + ec.message(),
        m_endpoint,
        {}});
}

} // namespace vmw_qmp
