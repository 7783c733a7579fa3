#include "logging_system.hpp"
#include <spdlog/pattern_formatter.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <iostream>
#include <filesystem>
#include <algorithm>
#include <map>
#include <unistd.h>

namespace energy_rollup {

std::shared_ptr<spdlog::logger> LoggingSystem::logger_;
LogLevel LoggingSystem::current_level_ = LogLevel::INFO;
bool LoggingSystem::initialized_ = false;

bool LoggingSystem::initialize(LogLevel log_level,
                              const std::string& log_file_path,
                              size_t max_file_size,
                              size_t max_files,
                              bool enable_console,
                              bool console_to_stderr) {
    try {
        std::vector<spdlog::sink_ptr> sinks;

        if (enable_console) {
            spdlog::sink_ptr console_sink;
            if (console_to_stderr) {
                console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
            } else {
                console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
            }
            console_sink->set_level(to_spdlog_level(log_level));
            sinks.push_back(console_sink);
        }

        if (!log_file_path.empty()) {
            std::filesystem::path log_path(log_file_path);
            if (log_path.has_parent_path()) {
                std::filesystem::create_directories(log_path.parent_path());
            }

            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file_path, max_file_size, max_files);
            file_sink->set_level(to_spdlog_level(log_level));
            sinks.push_back(file_sink);
        }

        // Re-initialization replaces the previous logger
        if (logger_) {
            spdlog::drop(logger_->name());
        }

        logger_ = std::make_shared<spdlog::logger>("energy_rollup", sinks.begin(), sinks.end());

        // Format: [timestamp] [level] [thread] component:operation - message {context}
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%f] [%l] [%t] %v");
        logger_->set_level(to_spdlog_level(log_level));

        spdlog::set_default_logger(logger_);

        current_level_ = log_level;
        initialized_ = true;

        info("Logging system initialized", {
            {"log_level", log_level_to_string(log_level)},
            {"file_path", log_file_path.empty() ? "console_only" : log_file_path},
            {"max_file_size", std::to_string(max_file_size)},
            {"max_files", std::to_string(max_files)}
        });

        return true;

    } catch (const std::exception& e) {
        std::cerr << "Failed to initialize logging system: " << e.what() << std::endl;
        return false;
    }
}

void LoggingSystem::shutdown() {
    if (initialized_) {
        info("Shutting down logging system");
        logger_->flush();
        spdlog::shutdown();
        logger_.reset();
        initialized_ = false;
    }
}

void LoggingSystem::set_log_level(LogLevel level) {
    current_level_ = level;
    if (logger_) {
        logger_->set_level(to_spdlog_level(level));
        for (auto& sink : logger_->sinks()) {
            sink->set_level(to_spdlog_level(level));
        }
    }
}

void LoggingSystem::log_daemon_startup(const std::string& version, const std::string& config_path) {
    info("daemon:startup - Energy rollup daemon starting", {
        {"version", version},
        {"config_path", config_path},
        {"pid", std::to_string(getpid())}
    });
}

void LoggingSystem::log_daemon_shutdown(const std::string& reason) {
    info("daemon:shutdown - Energy rollup daemon shutting down", {
        {"reason", reason},
        {"pid", std::to_string(getpid())}
    });
}

void LoggingSystem::log_job_started(int64_t from_timestamp, int64_t until_timestamp) {
    info("job:start - Bucket aggregation run started", {
        {"from", std::to_string(from_timestamp)},
        {"until", std::to_string(until_timestamp)},
        {"pending_minutes", std::to_string(std::max<int64_t>(0, (until_timestamp - from_timestamp) / 60))}
    });
}

void LoggingSystem::log_job_completed(uint64_t minutes_processed, uint64_t buckets_written,
                                      int64_t checkpoint) {
    info("job:complete - Bucket aggregation run completed", {
        {"minutes_processed", std::to_string(minutes_processed)},
        {"buckets_written", std::to_string(buckets_written)},
        {"checkpoint", std::to_string(checkpoint)}
    });
}

void LoggingSystem::log_job_error(const std::string& error_message, const ErrorContext& context) {
    log_with_context(LogLevel::ERROR, "job:error - " + error_message, context);
}

void LoggingSystem::log_bucket_write(int64_t bucket_start, uint32_t readings_count) {
    trace("storage:bucket - Bucket upserted", {
        {"bucket_start", std::to_string(bucket_start)},
        {"readings_count", std::to_string(readings_count)}
    });
}

void LoggingSystem::log_storage_error(const std::string& error_message, const ErrorContext& context) {
    log_with_context(LogLevel::ERROR, "storage:error - " + error_message, context);
}

void LoggingSystem::log_performance_metrics(const PerformanceMetrics& metrics) {
    info("performance:metrics - System performance update", {
        {"uptime_seconds", std::to_string(metrics.get_uptime().count())},
        {"job_success_rate", fmt::format("{:.2f}", metrics.get_job_success_rate() * 100)},
        {"job_runs_succeeded", std::to_string(metrics.job_runs_succeeded)},
        {"job_runs_failed", std::to_string(metrics.job_runs_failed)},
        {"job_runs_skipped", std::to_string(metrics.job_runs_skipped)},
        {"buckets_written", std::to_string(metrics.buckets_written)},
        {"sparse_minutes_skipped", std::to_string(metrics.sparse_minutes_skipped)},
        {"queries_served", std::to_string(metrics.queries_served)},
        {"cache_hit_rate", fmt::format("{:.2f}", metrics.get_cache_hit_rate() * 100)},
        {"slow_operations", std::to_string(metrics.slow_operations)},
        {"cache_entries", std::to_string(metrics.cache_entries)},
        {"cache_evictions", std::to_string(metrics.cache_evictions)},
        {"cache_invalidations", std::to_string(metrics.cache_invalidations)},
        {"memory_usage_mb", fmt::format("{:.2f}", metrics.memory_usage_bytes / (1024.0 * 1024.0))},
        {"cpu_usage_percent", fmt::format("{:.2f}", metrics.cpu_usage_percent)}
    });
}

void LoggingSystem::trace(const std::string& message, const std::unordered_map<std::string, std::string>& context) {
    write(LogLevel::TRACE, message, context);
}

void LoggingSystem::debug(const std::string& message, const std::unordered_map<std::string, std::string>& context) {
    write(LogLevel::DEBUG, message, context);
}

void LoggingSystem::info(const std::string& message, const std::unordered_map<std::string, std::string>& context) {
    write(LogLevel::INFO, message, context);
}

void LoggingSystem::warn(const std::string& message, const std::unordered_map<std::string, std::string>& context) {
    write(LogLevel::WARN, message, context);
}

void LoggingSystem::error(const std::string& message, const std::unordered_map<std::string, std::string>& context) {
    write(LogLevel::ERROR, message, context);
}

void LoggingSystem::critical(const std::string& message, const std::unordered_map<std::string, std::string>& context) {
    write(LogLevel::CRITICAL, message, context);
}

void LoggingSystem::log_with_context(LogLevel level, const std::string& message, const ErrorContext& context) {
    if (!initialized_ || !logger_) return;

    logger_->log(to_spdlog_level(level), message + " " + format_error_context(context));
}

void LoggingSystem::write(LogLevel level, const std::string& message,
                          const std::unordered_map<std::string, std::string>& context) {
    if (!initialized_ || !logger_) return;

    if (context.empty()) {
        logger_->log(to_spdlog_level(level), message);
    } else {
        logger_->log(to_spdlog_level(level), message + " " + format_context(context));
    }
}

bool LoggingSystem::is_initialized() {
    return initialized_;
}

LogLevel LoggingSystem::get_log_level() {
    return current_level_;
}

LogLevel LoggingSystem::string_to_log_level(const std::string& level_str) {
    std::string lower_level = level_str;
    std::transform(lower_level.begin(), lower_level.end(), lower_level.begin(), ::tolower);

    if (lower_level == "trace") return LogLevel::TRACE;
    if (lower_level == "debug") return LogLevel::DEBUG;
    if (lower_level == "info") return LogLevel::INFO;
    if (lower_level == "warn" || lower_level == "warning") return LogLevel::WARN;
    if (lower_level == "error") return LogLevel::ERROR;
    if (lower_level == "critical") return LogLevel::CRITICAL;

    return LogLevel::INFO;
}

std::string LoggingSystem::log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "trace";
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARN: return "warn";
        case LogLevel::ERROR: return "error";
        case LogLevel::CRITICAL: return "critical";
        default: return "info";
    }
}

std::string LoggingSystem::format_context(const std::unordered_map<std::string, std::string>& context) {
    if (context.empty()) return "";

    // Stable key order keeps log lines greppable
    std::map<std::string, std::string> ordered(context.begin(), context.end());

    std::string result = "{";
    bool first = true;
    for (const auto& [key, value] : ordered) {
        if (!first) result += ", ";
        result += key + "=" + value;
        first = false;
    }
    result += "}";
    return result;
}

std::string LoggingSystem::format_error_context(const ErrorContext& context) {
    std::unordered_map<std::string, std::string> context_map = {
        {"component", context.component},
        {"operation", context.operation}
    };

    if (!context.error_code.empty()) {
        context_map["error_code"] = context.error_code;
    }

    for (const auto& [key, value] : context.additional_data) {
        context_map[key] = value;
    }

    return format_context(context_map);
}

spdlog::level::level_enum LoggingSystem::to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return spdlog::level::trace;
        case LogLevel::DEBUG: return spdlog::level::debug;
        case LogLevel::INFO: return spdlog::level::info;
        case LogLevel::WARN: return spdlog::level::warn;
        case LogLevel::ERROR: return spdlog::level::err;
        case LogLevel::CRITICAL: return spdlog::level::critical;
        default: return spdlog::level::info;
    }
}

PerformanceTimer::PerformanceTimer(const std::string& operation_name)
    : operation_name_(operation_name), start_time_(std::chrono::steady_clock::now()) {
}

PerformanceTimer::~PerformanceTimer() {
    auto end_time = std::chrono::steady_clock::now();
    auto duration = std::chrono::duration_cast<std::chrono::microseconds>(end_time - start_time_);

    LoggingSystem::debug("performance:timer - Operation completed", {
        {"operation", operation_name_},
        {"duration_us", std::to_string(duration.count())},
        {"duration_ms", fmt::format("{:.3f}", duration.count() / 1000.0)}
    });
}

} // namespace energy_rollup
