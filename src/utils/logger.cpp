#include "issfeed/utils/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <vector>

namespace issfeed {
namespace utils {

std::shared_ptr<spdlog::logger> Logger::logger_ = nullptr;
LogLevel Logger::current_level_ = LogLevel::INFO;

std::optional<LogLevel> try_parse_log_level(const std::string& name) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::TRACE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "CRITICAL") return LogLevel::CRITICAL;
    return std::nullopt;
}

LogLevel parse_log_level(const std::string& name, LogLevel fallback) {
    return try_parse_log_level(name).value_or(fallback);
}

std::string log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::CRITICAL: return "CRITICAL";
    }
    return "INFO";
}

void Logger::initialize(const std::string& log_file_path, LogLevel level,
                        size_t max_file_size, size_t max_files, bool console_output) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (console_output) {
            auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            console_sink->set_level(to_spdlog_level(level));
            console_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
            sinks.push_back(console_sink);
        }

        if (!log_file_path.empty()) {
            std::filesystem::path log_path(log_file_path);
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file_path, max_file_size, max_files);
            file_sink->set_level(to_spdlog_level(level));
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(file_sink);
        }

        if (logger_) {
            spdlog::drop(logger_->name());
        }

        logger_ = std::make_shared<spdlog::logger>("issfeed", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(level));
        current_level_ = level;

        spdlog::register_logger(logger_);
        logger_->flush_on(spdlog::level::warn);

        Logger::info("Logger initialized at level {}", log_level_name(level));

    } catch (const std::exception& e) {
        std::cerr << "Logger initialization failed: " << e.what() << std::endl;
        throw;
    }
}

void Logger::shutdown() {
    if (logger_) {
        logger_->flush();
        spdlog::drop(logger_->name());
        logger_ = nullptr;
    }
}

void Logger::set_level(LogLevel level) {
    current_level_ = level;
    if (logger_) {
        logger_->set_level(to_spdlog_level(level));
        for (auto& sink : logger_->sinks()) {
            sink->set_level(to_spdlog_level(level));
        }
    }
}

LogLevel Logger::get_level() {
    return current_level_;
}

bool Logger::is_enabled(LogLevel level) {
    return level >= current_level_;
}

spdlog::level::level_enum Logger::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
    }
    return spdlog::level::info;
}

// FeedLogger

void FeedLogger::log_quote_resolved(const std::string& symbol, double last, double previous_close,
                                    double change, double change_percent, long long volume) {
    Logger::debug("QUOTE symbol={} last={} prev={} change={} change_pct={:.2f}% volume={}",
                  symbol, last, previous_close, change, change_percent, volume);
}

void FeedLogger::log_degraded_board(const std::string& symbol, const std::string& table,
                                    const std::string& wanted_board) {
    Logger::warn("BOARD_FALLBACK symbol={} table={} wanted={} using first row",
                 symbol, table, wanted_board);
}

void FeedLogger::log_item_dropped(const std::string& symbol, const std::string& reason) {
    Logger::warn("ITEM_DROPPED symbol={} reason={}", symbol, reason);
}

void FeedLogger::log_batch_summary(size_t requested, size_t resolved, long long elapsed_ms) {
    Logger::info("BATCH requested={} resolved={} elapsed={}ms", requested, resolved, elapsed_ms);
}

void FeedLogger::log_systemic_outage(const std::string& symbol, const std::string& cause) {
    Logger::error("SOURCE_UNREACHABLE symbol={} cause={}", symbol, cause);
}

// ScopedTimer

ScopedTimer::ScopedTimer(const std::string& operation_name)
    : operation_name_(operation_name), start_time_(std::chrono::steady_clock::now()) {
}

ScopedTimer::~ScopedTimer() {
    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time_);
    Logger::debug("Operation '{}' completed in {} ms", operation_name_, duration.count());
}

} // namespace utils
} // namespace issfeed
