#pragma once

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace issfeed {
namespace utils {

enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

// Accepts TRACE/DEBUG/INFO/WARN/WARNING/ERROR/CRITICAL in any case
std::optional<LogLevel> try_parse_log_level(const std::string& name);
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::INFO);
std::string log_level_name(LogLevel level);

class Logger {
public:
    static void initialize(const std::string& log_file_path = "logs/issfeed.log",
                           LogLevel level = LogLevel::INFO,
                           size_t max_file_size = 1024 * 1024 * 10,  // 10MB
                           size_t max_files = 3,
                           bool console_output = true);

    static void shutdown();

    template<typename... Args>
    static void trace(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->trace(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->debug(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->info(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->warn(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->error(fmt, std::forward<Args>(args)...);
        }
    }

    template<typename... Args>
    static void critical(spdlog::format_string_t<Args...> fmt, Args&&... args) {
        if (logger_) {
            logger_->critical(fmt, std::forward<Args>(args)...);
        }
    }

    static void set_level(LogLevel level);
    static LogLevel get_level();
    static bool is_enabled(LogLevel level);

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static LogLevel current_level_;

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);
};

// One-line events for the feed domain
class FeedLogger {
public:
    static void log_quote_resolved(const std::string& symbol, double last, double previous_close,
                                   double change, double change_percent, long long volume);

    static void log_degraded_board(const std::string& symbol, const std::string& table,
                                   const std::string& wanted_board);

    static void log_item_dropped(const std::string& symbol, const std::string& reason);

    static void log_batch_summary(size_t requested, size_t resolved, long long elapsed_ms);

    static void log_systemic_outage(const std::string& symbol, const std::string& cause);
};

// RAII timer that logs the scope duration at DEBUG level
class ScopedTimer {
public:
    explicit ScopedTimer(const std::string& operation_name);
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    std::string operation_name_;
    std::chrono::steady_clock::time_point start_time_;
};

#define ISSFEED_LOG_TRACE(...) issfeed::utils::Logger::trace(__VA_ARGS__)
#define ISSFEED_LOG_DEBUG(...) issfeed::utils::Logger::debug(__VA_ARGS__)
#define ISSFEED_LOG_INFO(...) issfeed::utils::Logger::info(__VA_ARGS__)
#define ISSFEED_LOG_WARN(...) issfeed::utils::Logger::warn(__VA_ARGS__)
#define ISSFEED_LOG_ERROR(...) issfeed::utils::Logger::error(__VA_ARGS__)
#define ISSFEED_LOG_CRITICAL(...) issfeed::utils::Logger::critical(__VA_ARGS__)

#define ISSFEED_SCOPED_TIMER(name) issfeed::utils::ScopedTimer issfeed_scoped_timer_(name)

} // namespace utils
} // namespace issfeed
