#pragma once

#include <string>
#include <memory>
#include <chrono>
#include <unordered_map>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/fmt/fmt.h>

namespace energy_rollup {

/**
 * Runtime counters reported periodically by the daemon
 */
struct PerformanceMetrics {
    std::chrono::steady_clock::time_point start_time;
    uint64_t job_runs_succeeded{0};
    uint64_t job_runs_failed{0};
    uint64_t job_runs_skipped{0};
    uint64_t buckets_written{0};
    uint64_t sparse_minutes_skipped{0};
    uint64_t queries_served{0};
    uint64_t query_cache_hits{0};
    uint64_t slow_operations{0};
    uint64_t cache_entries{0};
    uint64_t cache_evictions{0};
    uint64_t cache_invalidations{0};
    uint64_t memory_usage_bytes{0};
    double cpu_usage_percent{0.0};

    std::chrono::seconds get_uptime() const {
        return std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - start_time);
    }

    double get_job_success_rate() const {
        uint64_t total = job_runs_succeeded + job_runs_failed;
        return total > 0 ? static_cast<double>(job_runs_succeeded) / total : 0.0;
    }

    double get_cache_hit_rate() const {
        return queries_served > 0 ? static_cast<double>(query_cache_hits) / queries_served : 0.0;
    }
};

enum class LogLevel {
    TRACE,
    DEBUG,
    INFO,
    WARN,
    ERROR,
    CRITICAL
};

/**
 * Context information for error logging
 */
struct ErrorContext {
    std::string component;
    std::string operation;
    std::string error_code;
    std::unordered_map<std::string, std::string> additional_data;

    ErrorContext(const std::string& comp, const std::string& op, const std::string& code = "")
        : component(comp), operation(op), error_code(code) {}

    ErrorContext& add_data(const std::string& key, const std::string& value) {
        additional_data[key] = value;
        return *this;
    }
};

/**
 * Centralized logging system with structured output and rotation
 */
class LoggingSystem {
public:
    /**
     * Initialize the logging system
     * @param log_level Minimum log level to output
     * @param log_file_path Path to log file (empty for console only)
     * @param max_file_size Maximum size of each log file in bytes
     * @param max_files Maximum number of rotated log files to keep
     * @param enable_console Whether to also log to console
     * @param console_to_stderr Send console output to stderr, keeping stdout for command output
     * @return true if initialization successful
     */
    static bool initialize(LogLevel log_level,
                          const std::string& log_file_path = "",
                          size_t max_file_size = 10 * 1024 * 1024,
                          size_t max_files = 5,
                          bool enable_console = true,
                          bool console_to_stderr = false);

    static void shutdown();

    static void set_log_level(LogLevel level);

    /**
     * Daemon lifecycle events
     */
    static void log_daemon_startup(const std::string& version, const std::string& config_path);
    static void log_daemon_shutdown(const std::string& reason);

    /**
     * Aggregation job events
     */
    static void log_job_started(int64_t from_timestamp, int64_t until_timestamp);
    static void log_job_completed(uint64_t minutes_processed, uint64_t buckets_written,
                                  int64_t checkpoint);
    static void log_job_error(const std::string& error_message, const ErrorContext& context);

    /**
     * Storage events
     */
    static void log_bucket_write(int64_t bucket_start, uint32_t readings_count);
    static void log_storage_error(const std::string& error_message, const ErrorContext& context);

    static void log_performance_metrics(const PerformanceMetrics& metrics);

    /**
     * Generic structured logging methods
     */
    static void trace(const std::string& message, const std::unordered_map<std::string, std::string>& context = {});
    static void debug(const std::string& message, const std::unordered_map<std::string, std::string>& context = {});
    static void info(const std::string& message, const std::unordered_map<std::string, std::string>& context = {});
    static void warn(const std::string& message, const std::unordered_map<std::string, std::string>& context = {});
    static void error(const std::string& message, const std::unordered_map<std::string, std::string>& context = {});
    static void critical(const std::string& message, const std::unordered_map<std::string, std::string>& context = {});

    static void log_with_context(LogLevel level, const std::string& message, const ErrorContext& context);

    static bool is_initialized();

    static LogLevel get_log_level();

    static LogLevel string_to_log_level(const std::string& level_str);

    static std::string log_level_to_string(LogLevel level);

    /**
     * Format context data as "{key=value, ...}" with keys in sorted order
     */
    static std::string format_context(const std::unordered_map<std::string, std::string>& context);

private:
    static std::shared_ptr<spdlog::logger> logger_;
    static LogLevel current_level_;
    static bool initialized_;

    static void write(LogLevel level, const std::string& message,
                      const std::unordered_map<std::string, std::string>& context);

    static std::string format_error_context(const ErrorContext& context);

    static spdlog::level::level_enum to_spdlog_level(LogLevel level);
};

/**
 * RAII helper for performance timing
 */
class PerformanceTimer {
public:
    explicit PerformanceTimer(const std::string& operation_name);
    ~PerformanceTimer();

    PerformanceTimer(const PerformanceTimer&) = delete;
    PerformanceTimer& operator=(const PerformanceTimer&) = delete;
    PerformanceTimer(PerformanceTimer&&) = delete;
    PerformanceTimer& operator=(PerformanceTimer&&) = delete;

private:
    std::string operation_name_;
    std::chrono::steady_clock::time_point start_time_;
};

// Convenience macros for structured logging
#define LOG_TRACE(msg, ...) energy_rollup::LoggingSystem::trace(msg, ##__VA_ARGS__)
#define LOG_DEBUG(msg, ...) energy_rollup::LoggingSystem::debug(msg, ##__VA_ARGS__)
#define LOG_INFO(msg, ...) energy_rollup::LoggingSystem::info(msg, ##__VA_ARGS__)
#define LOG_WARN(msg, ...) energy_rollup::LoggingSystem::warn(msg, ##__VA_ARGS__)
#define LOG_ERROR(msg, ...) energy_rollup::LoggingSystem::error(msg, ##__VA_ARGS__)
#define LOG_CRITICAL(msg, ...) energy_rollup::LoggingSystem::critical(msg, ##__VA_ARGS__)

#define PERF_TIMER(name) energy_rollup::PerformanceTimer _timer(name)

} // namespace energy_rollup
