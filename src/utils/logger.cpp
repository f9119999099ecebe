// ============================================================================
// AEGIS TRADE CORE - Logger Implementation
// ============================================================================

#include "aegis/utils/logger.hpp"

#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <filesystem>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace aegis::utils {

namespace {

constexpr const char* LOGGER_NAME = "aegis";

spdlog::level::level_enum to_spdlog(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Critical: return spdlog::level::critical;
        case LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace

LogLevel parse_log_level(std::string_view name) noexcept {
    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "critical") return LogLevel::Critical;
    if (name == "off") return LogLevel::Off;
    return LogLevel::Info;
}

void Logger::initialize(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

    if (!config.log_file.empty()) {
        const std::filesystem::path path(config.log_file);
        if (path.has_parent_path()) {
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            if (ec) {
                throw std::runtime_error("cannot create log directory " +
                                         path.parent_path().string() + ": " + ec.message());
            }
        }
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file, config.max_file_size_mb * 1024 * 1024, config.max_files));
    }

    std::shared_ptr<spdlog::logger> logger;
    if (config.async) {
        spdlog::init_thread_pool(config.queue_size, 1);
        logger = std::make_shared<spdlog::async_logger>(
            LOGGER_NAME, sinks.begin(), sinks.end(), spdlog::thread_pool(),
            spdlog::async_overflow_policy::block);
    } else {
        logger = std::make_shared<spdlog::logger>(LOGGER_NAME, sinks.begin(), sinks.end());
    }

    logger->set_pattern(config.pattern);
    logger->set_level(to_spdlog(config.level));
    logger->flush_on(spdlog::level::warn);

    spdlog::drop(LOGGER_NAME);
    spdlog::set_default_logger(logger);
    spdlog::flush_every(std::chrono::seconds(
        std::max<size_t>(1, config.flush_interval_ms / 1000)));

    instance().logger_ = std::move(logger);
}

void Logger::shutdown() {
    auto& self = instance();
    if (self.logger_) {
        self.logger_->flush();
    }
    self.logger_.reset();
    spdlog::shutdown();
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) {
    sink()->set_level(to_spdlog(level));
}

void Logger::flush() {
    sink()->flush();
}

std::shared_ptr<spdlog::logger> Logger::sink() const {
    if (logger_) return logger_;
    if (auto fallback = spdlog::default_logger()) return fallback;
    // spdlog::shutdown() clears the default logger
    static const auto console = std::make_shared<spdlog::logger>(
        "aegis_console", std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    return console;
}

// ============================================================================
// ScopedTimer
// ============================================================================

void ScopedTimer::log_duration(int64_t microseconds) const {
    switch (level_) {
        case LogLevel::Trace: LOG_TRACE("{} took {} us", name_, microseconds); break;
        case LogLevel::Debug: LOG_DEBUG("{} took {} us", name_, microseconds); break;
        case LogLevel::Info: LOG_INFO("{} took {} us", name_, microseconds); break;
        case LogLevel::Warn: LOG_WARN("{} took {} us", name_, microseconds); break;
        case LogLevel::Error: LOG_ERROR("{} took {} us", name_, microseconds); break;
        case LogLevel::Critical: LOG_CRITICAL("{} took {} us", name_, microseconds); break;
        case LogLevel::Off: break;
    }
}

}  // namespace aegis::utils
