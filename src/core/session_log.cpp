/// @file session_log.cpp
/// @brief Session log sink built on spdlog

#include <vmwarden/core/session_log.hpp>
#include <vmwarden/core/log.hpp>

#include <spdlog/details/file_helper.h>
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/base_sink.h>

#include <mutex>
#include <string_view>
#include <system_error>

namespace vmw_core {

namespace {

constexpr const char* kStampedLoggerName = "session";
constexpr const char* kPlainLoggerName = "session.plain";

/// Append-only file sink choosing its layout from the emitting logger
class SessionFileSink final : public spdlog::sinks::base_sink<std::mutex> {
public:
    explicit SessionFileSink(const std::filesystem::path& path)
        : m_stamped(std::make_unique<spdlog::pattern_formatter>("%H:%M:%S  %v"))
        , m_plain(std::make_unique<spdlog::pattern_formatter>("%v"))
    {
        // file_helper opens in "ab" mode unless asked to truncate
        m_file.open(path.string(), false);
    }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        spdlog::memory_buf_t formatted;
        std::string_view name(msg.logger_name.data(), msg.logger_name.size());
        if (name == kPlainLoggerName) {
            m_plain->format(msg, formatted);
        } else {
            m_stamped->format(msg, formatted);
        }
        m_file.write(formatted);
    }

    void flush_() override {
        m_file.flush();
    }

    // Layout is fixed per logger; ignore pattern changes
    void set_pattern_(const std::string&) override {}
    void set_formatter_(std::unique_ptr<spdlog::formatter>) override {}

private:
    spdlog::details::file_helper m_file;
    std::unique_ptr<spdlog::formatter> m_stamped;
    std::unique_ptr<spdlog::formatter> m_plain;
};

} // anonymous namespace

Result<std::unique_ptr<SessionLog>> SessionLog::open(
    const std::filesystem::path& path, SessionLogOptions options)
{
    if (options.recreate) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }

    std::shared_ptr<SessionFileSink> sink;
    try {
        sink = std::make_shared<SessionFileSink>(path);
    } catch (const spdlog::spdlog_ex& e) {
        return Err<std::unique_ptr<SessionLog>>(
            Error(ErrorCode::IOError, "Cannot open session log: " + std::string(e.what()))
                .with_context("path", path.string()));
    }

    auto stamped = std::make_shared<spdlog::logger>(kStampedLoggerName, sink);
    auto plain = std::make_shared<spdlog::logger>(kPlainLoggerName, sink);
    for (auto* logger : {stamped.get(), plain.get()}) {
        logger->set_level(spdlog::level::trace);
        if (options.flush_each) {
            logger->flush_on(spdlog::level::trace);
        }
    }

    core_logger()->debug("Session log opened at {}", path.string());

    return Ok(std::unique_ptr<SessionLog>(
        new SessionLog(path, std::move(stamped), std::move(plain))));
}

SessionLog::SessionLog(std::filesystem::path path,
                       std::shared_ptr<spdlog::logger> stamped,
                       std::shared_ptr<spdlog::logger> plain)
    : m_path(std::move(path))
    , m_stamped(std::move(stamped))
    , m_plain(std::move(plain))
{
}

SessionLog::~SessionLog() {
    flush();
}

void SessionLog::line(std::string_view message) {
    m_stamped->info("{}", message);
}

void SessionLog::plain(std::string_view message) {
    m_plain->info("{}", message);
}

void SessionLog::flush() {
    m_stamped->flush();
}

} // namespace vmw_core
