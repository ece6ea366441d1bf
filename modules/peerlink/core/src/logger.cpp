#include "logger.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <random>
#include <thread>

namespace peerlink {

namespace {

/**
 * @brief Tag written in front of every line.
 */
std::string g_sessionId = "NO_SESSION";

/**
 * @brief Guards g_sessionId, g_logCallback and the output stream.
 */
std::mutex g_logMutex;

std::function<void(const std::string&)> g_logCallback;

std::atomic<int> g_log_level(static_cast<int>(LogLevel::INFO));

/**
 * @brief Async logging state
 */
std::atomic<bool> g_async_logging_enabled(false);
std::deque<std::string> g_log_queue;
std::mutex g_log_queue_mutex;
std::condition_variable g_log_queue_cv;
bool g_log_thread_running = false;
std::unique_ptr<std::thread> g_log_thread;
std::mutex g_lifecycle_mutex;

void write_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_logCallback) {
        g_logCallback(line);
    } else {
        std::cerr << line << std::endl;
    }
}

void async_log_worker() {
    std::unique_lock<std::mutex> lock(g_log_queue_mutex);
    for (;;) {
        g_log_queue_cv.wait(lock, [] { return !g_log_queue.empty() || !g_log_thread_running; });
        if (g_log_queue.empty() && !g_log_thread_running) {
            break;
        }

        std::deque<std::string> batch;
        batch.swap(g_log_queue);
        lock.unlock();
        // Write without holding the queue lock so producers never wait on stderr.
        for (const auto& line : batch) {
            write_line(line);
        }
        lock.lock();
    }
}

} // namespace

std::string generate_session_id(size_t len) {
    static const char alphanum[] =
        "0123456789"
        "abcdefghijklmnopqrstuvwxyz";
    std::string out;
    out.reserve(len);

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> distrib(0, sizeof(alphanum) - 2);
    for (size_t i = 0; i < len; ++i) {
        out += alphanum[distrib(gen)];
    }
    return out;
}

void setSessionId(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_sessionId = session_id;
}

void setLogCallback(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_logCallback = std::move(callback);
}

void set_log_level(LogLevel level) {
    g_log_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel get_log_level() {
    return static_cast<LogLevel>(g_log_level.load(std::memory_order_relaxed));
}

LogLevel parse_log_level(const std::string& value, LogLevel fallback) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (v == "debug") return LogLevel::DEBUG;
    if (v == "info") return LogLevel::INFO;
    if (v == "warn" || v == "warning") return LogLevel::WARNING;
    if (v == "error") return LogLevel::ERROR;
    if (v == "none") return LogLevel::NONE;
    return fallback;
}

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARNING: return "warning";
        case LogLevel::ERROR: return "error";
        case LogLevel::NONE: return "none";
    }
    return "unknown";
}

void enable_async_logging() {
    std::lock_guard<std::mutex> lifecycle(g_lifecycle_mutex);
    if (g_async_logging_enabled) return;

    {
        std::lock_guard<std::mutex> lock(g_log_queue_mutex);
        g_log_thread_running = true;
    }
    g_log_thread = std::make_unique<std::thread>(async_log_worker);
    g_async_logging_enabled = true;
}

void disable_async_logging() {
    std::lock_guard<std::mutex> lifecycle(g_lifecycle_mutex);
    if (!g_async_logging_enabled) return;

    g_async_logging_enabled = false;
    {
        std::lock_guard<std::mutex> lock(g_log_queue_mutex);
        g_log_thread_running = false;
    }
    g_log_queue_cv.notify_all();

    if (g_log_thread && g_log_thread->joinable()) {
        g_log_thread->join();
    }
    g_log_thread.reset();
}

bool is_async_logging_enabled() {
    return g_async_logging_enabled.load();
}

void nativeLog(const std::string& message) {
    std::string log_message;
    {
        std::lock_guard<std::mutex> lock(g_logMutex);
        log_message = "[" + g_sessionId + "] " + message;
    }

    if (is_async_logging_enabled()) {
        {
            std::lock_guard<std::mutex> lock(g_log_queue_mutex);
            if (g_log_thread_running) {
                g_log_queue.push_back(std::move(log_message));
                g_log_queue_cv.notify_one();
                return;
            }
        }
    }
    write_line(log_message);
}

} // namespace peerlink
