#pragma once
// ============================================================================
// AEGIS TRADE CORE - Logger
// ============================================================================
// Thin wrapper over spdlog: console + rotating file sinks, optional async
// Format strings are checked at compile time by fmt
// ============================================================================

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace aegis::utils {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Critical,
    Off
};

[[nodiscard]] LogLevel parse_log_level(std::string_view name) noexcept;

// ============================================================================
// Logger Configuration
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Info;
    std::string log_file = "logs/aegis_cycle.log";  // empty = console only
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v";

    bool async = true;
    size_t queue_size = 8192;
    size_t flush_interval_ms = 1000;

    // File settings
    size_t max_file_size_mb = 100;
    size_t max_files = 10;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    /// Initialize the global logger
    static void initialize(const LogConfig& config = LogConfig{});

    /// Shutdown the logger (flush and close)
    static void shutdown();

    /// Global instance; falls back to spdlog's default console logger
    static Logger& instance();

    void set_level(LogLevel level);

    template <typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        sink()->trace(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        sink()->debug(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        sink()->info(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        sink()->warn(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        sink()->error(fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        sink()->critical(fmt, std::forward<Args>(args)...);
    }

    void flush();

private:
    Logger() = default;

    [[nodiscard]] std::shared_ptr<spdlog::logger> sink() const;

    std::shared_ptr<spdlog::logger> logger_;
};

// ============================================================================
// Convenience Macros
// ============================================================================

#define LOG_TRACE(...) ::aegis::utils::Logger::instance().trace(__VA_ARGS__)
#define LOG_DEBUG(...) ::aegis::utils::Logger::instance().debug(__VA_ARGS__)
#define LOG_INFO(...) ::aegis::utils::Logger::instance().info(__VA_ARGS__)
#define LOG_WARN(...) ::aegis::utils::Logger::instance().warn(__VA_ARGS__)
#define LOG_ERROR(...) ::aegis::utils::Logger::instance().error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::aegis::utils::Logger::instance().critical(__VA_ARGS__)

// ============================================================================
// Scoped Timer for Performance Measurement
// ============================================================================

class ScopedTimer {
public:
    explicit ScopedTimer(std::string_view name, LogLevel level = LogLevel::Debug)
        : name_(name), level_(level), start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        const auto end = std::chrono::steady_clock::now();
        const auto duration =
            std::chrono::duration_cast<std::chrono::microseconds>(end - start_).count();
        log_duration(duration);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    void log_duration(int64_t microseconds) const;

    std::string_view name_;
    LogLevel level_;
    std::chrono::steady_clock::time_point start_;
};

#define AEGIS_CONCAT_INNER(a, b) a##b
#define AEGIS_CONCAT(a, b) AEGIS_CONCAT_INNER(a, b)
#define SCOPED_TIMER(name) ::aegis::utils::ScopedTimer AEGIS_CONCAT(scoped_timer_, __LINE__)(name)

}  // namespace aegis::utils
