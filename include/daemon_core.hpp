#pragma once

#include <memory>
#include <atomic>
#include <chrono>
#include <string>
#include <unordered_map>
#include <csignal>
#include "config_manager.hpp"
#include "logging_system.hpp"
#include "time_series_storage.hpp"
#include "performance_cache.hpp"
#include "bucket_aggregator.hpp"
#include "query_engine.hpp"
#include "energy_api_server.hpp"

namespace energy_rollup {

constexpr const char* ENERGY_ROLLUP_VERSION = "1.0.0";

/**
 * Error severity levels for error handling and recovery
 */
enum class ErrorSeverity {
    RECOVERABLE,    // Temporary errors that can be retried
    WARNING,        // Non-critical errors that don't stop operation
    CRITICAL        // Fatal errors that require daemon shutdown
};

/**
 * Error handler for managing different types of errors and recovery strategies
 */
class ErrorHandler {
public:
    /**
     * Handle an error with appropriate recovery strategy
     * @param e Exception that occurred
     * @param severity Severity level of the error
     * @param operation Description of the operation that failed
     * @return Consecutive failure count of the operation
     */
    int handle_error(const std::exception& e, ErrorSeverity severity, const std::string& operation);

    /**
     * Map an exception to a severity: checkpoint conflicts are warnings,
     * configuration errors are critical, everything else is retried
     */
    static ErrorSeverity classify(const std::exception& e);

    /**
     * Check if an operation should be retried
     * @param attempt_count Current attempt number
     * @return true if retry should be attempted
     */
    bool should_retry(int attempt_count) const;

    /**
     * Get exponential backoff delay for retry
     * @param attempt_count Current attempt number
     * @return Delay duration before next retry
     */
    std::chrono::milliseconds get_backoff_delay(int attempt_count) const;

    void reset_retry_count(const std::string& operation);

    int get_retry_count(const std::string& operation) const;

private:
    std::unordered_map<std::string, int> retry_counts_;
    static constexpr int MAX_RETRIES = 5;
    static constexpr std::chrono::milliseconds BASE_DELAY{1000};
    static constexpr std::chrono::milliseconds MAX_DELAY{60000};

    void log_error(const std::exception& e, ErrorSeverity severity, const std::string& operation);
};

/**
 * Main daemon core class: owns the storage, cache, aggregator and query
 * engine, drives the aggregation job once per interval and serves the
 * query engine over HTTP
 */
class DaemonCore {
public:
    DaemonCore();

    /**
     * Destructor - ensures proper cleanup
     */
    ~DaemonCore();

    // Non-copyable and non-movable
    DaemonCore(const DaemonCore&) = delete;
    DaemonCore& operator=(const DaemonCore&) = delete;
    DaemonCore(DaemonCore&&) = delete;
    DaemonCore& operator=(DaemonCore&&) = delete;

    /**
     * Initialize the daemon with configuration
     * @param config_path Path to configuration file
     * @param foreground Stay attached to the terminal and log to the console
     * @return true if initialization successful
     */
    bool initialize(const std::string& config_path, bool foreground = false);

    /**
     * Run the main daemon loop
     * This method blocks until shutdown is requested
     */
    void run();

    /**
     * Request graceful shutdown
     */
    void shutdown();

    bool is_running() const;

    PerformanceMetrics get_metrics() const;

private:
    DaemonConfig config_;
    std::unique_ptr<TimeSeriesStorage> storage_;
    std::unique_ptr<InMemoryQueryCache> cache_;
    std::unique_ptr<BucketAggregator> aggregator_;
    std::unique_ptr<EnergyQueryEngine> query_engine_;
    std::unique_ptr<EnergyApiServer> api_server_;
    std::unique_ptr<ErrorHandler> error_handler_;

    std::atomic<bool> running_;
    std::atomic<bool> shutdown_requested_;
    bool foreground_mode_;

    PerformanceMetrics metrics_;
    std::chrono::steady_clock::time_point last_metrics_log_;

    // Signal handling
    static std::atomic<bool> signal_received_;
    static std::atomic<int> received_signal_;
    static DaemonCore* instance_;

    void setup_signal_handlers();

    static void signal_handler(int signal);

    /**
     * Detach from the terminal (fork, setsid, etc.)
     * @return true if daemonization successful
     */
    bool daemonize();

    void main_loop();

    /**
     * Run the aggregation job once
     * @return Delay before the next cycle, shortened to a backoff after failures
     */
    std::chrono::milliseconds perform_aggregation_cycle();

    bool initialize_components();

    void cleanup_resources();

    /**
     * Update and log performance metrics
     */
    void update_performance_metrics();

    /**
     * Send systemd notifications about daemon status
     * @param status Status message to send
     */
    void notify_systemd(const std::string& status);

    bool check_system_health();

    /**
     * Sleep for the given delay. Can be interrupted by shutdown signal
     * @return true if sleep completed normally, false if interrupted
     */
    bool sleep_until_next_cycle(std::chrono::milliseconds delay);

    uint64_t get_memory_usage() const;

    double get_cpu_usage() const;
};

} // namespace energy_rollup
