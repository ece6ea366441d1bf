#ifndef PEERLINK_LOGGER_H
#define PEERLINK_LOGGER_H

#include <string>
#include <functional>

namespace peerlink {

// Log level enumeration for conditional logging
enum class LogLevel {
    DEBUG = 0,     // Every message (most verbose)
    INFO = 1,      // Important events
    WARNING = 2,   // Problems only
    ERROR = 3,     // Errors only
    NONE = 4,      // Disable all logging
};

// Tag prepended to every log line, e.g. "[a1b2c3] PC: ..."
void setSessionId(const std::string& session_id);
std::string generate_session_id(size_t len);

void nativeLog(const std::string& message);

// Route log lines to a callback instead of stderr (desktop CLI uses this).
// Passing an empty function restores stderr output.
void setLogCallback(std::function<void(const std::string&)> callback);

// Default: INFO (skips debug messages)
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Accepts debug|info|warn|warning|error|none, case-insensitive.
// Unknown values map to `fallback`.
LogLevel parse_log_level(const std::string& value, LogLevel fallback = LogLevel::INFO);
const char* log_level_to_string(LogLevel level);

// Async mode: log lines are queued and written by a background thread.
// disable_async_logging() drains the queue before returning.
void enable_async_logging();
void disable_async_logging();
bool is_async_logging_enabled();

} // namespace peerlink

#define LOG_DEBUG(msg) do { if (::peerlink::get_log_level() <= ::peerlink::LogLevel::DEBUG) ::peerlink::nativeLog(msg); } while (0)
#define LOG_INFO(msg)  do { if (::peerlink::get_log_level() <= ::peerlink::LogLevel::INFO) ::peerlink::nativeLog(msg); } while (0)
#define LOG_WARN(msg)  do { if (::peerlink::get_log_level() <= ::peerlink::LogLevel::WARNING) ::peerlink::nativeLog(msg); } while (0)
#define LOG_ERROR(msg) do { if (::peerlink::get_log_level() <= ::peerlink::LogLevel::ERROR) ::peerlink::nativeLog(msg); } while (0)

#endif // PEERLINK_LOGGER_H
