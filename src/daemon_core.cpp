#include "daemon_core.hpp"
#include <unistd.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <fcntl.h>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <iostream>
#include <algorithm>
#include <thread>
#include <typeinfo>
#include <csignal>
#ifdef HAVE_SYSTEMD
#include <systemd/sd-daemon.h>
#endif

namespace energy_rollup {

// Static member definitions
std::atomic<bool> DaemonCore::signal_received_{false};
std::atomic<int> DaemonCore::received_signal_{0};
DaemonCore* DaemonCore::instance_ = nullptr;

// ErrorHandler implementation
int ErrorHandler::handle_error(const std::exception& e, ErrorSeverity severity, const std::string& operation) {
    log_error(e, severity, operation);

    if (severity == ErrorSeverity::CRITICAL) {
        LOG_CRITICAL("Critical error in operation: " + operation + " - " + e.what());
    }

    return ++retry_counts_[operation];
}

ErrorSeverity ErrorHandler::classify(const std::exception& e) {
    if (dynamic_cast<const CheckpointConflictError*>(&e) != nullptr) {
        return ErrorSeverity::WARNING;
    }
    if (dynamic_cast<const ConfigurationError*>(&e) != nullptr) {
        return ErrorSeverity::CRITICAL;
    }
    return ErrorSeverity::RECOVERABLE;
}

bool ErrorHandler::should_retry(int attempt_count) const {
    return attempt_count < MAX_RETRIES;
}

std::chrono::milliseconds ErrorHandler::get_backoff_delay(int attempt_count) const {
    auto delay = BASE_DELAY * (1 << std::min(attempt_count, 10)); // Cap at 2^10
    return std::min<std::chrono::milliseconds>(delay, MAX_DELAY);
}

void ErrorHandler::reset_retry_count(const std::string& operation) {
    retry_counts_[operation] = 0;
}

int ErrorHandler::get_retry_count(const std::string& operation) const {
    auto it = retry_counts_.find(operation);
    return it == retry_counts_.end() ? 0 : it->second;
}

void ErrorHandler::log_error(const std::exception& e, ErrorSeverity severity, const std::string& operation) {
    ErrorContext context("daemon_core", operation);
    context.add_data("error_type", typeid(e).name())
           .add_data("severity", severity == ErrorSeverity::RECOVERABLE ? "recoverable" :
                                severity == ErrorSeverity::WARNING ? "warning" : "critical");

    switch (severity) {
        case ErrorSeverity::RECOVERABLE:
        case ErrorSeverity::WARNING:
            LoggingSystem::log_with_context(LogLevel::WARN, e.what(), context);
            break;
        case ErrorSeverity::CRITICAL:
            LoggingSystem::log_with_context(LogLevel::CRITICAL, e.what(), context);
            break;
    }
}

// DaemonCore implementation
DaemonCore::DaemonCore()
    : error_handler_(std::make_unique<ErrorHandler>())
    , running_(false)
    , shutdown_requested_(false)
    , foreground_mode_(false)
    , last_metrics_log_(std::chrono::steady_clock::now()) {

    instance_ = this;
    metrics_.start_time = std::chrono::steady_clock::now();
}

DaemonCore::~DaemonCore() {
    if (running_) {
        shutdown();
    }
    cleanup_resources();
    instance_ = nullptr;
}

bool DaemonCore::initialize(const std::string& config_path, bool foreground) {
    try {
        foreground_mode_ = foreground;

        config_ = ConfigManager::load_config(config_path);

        LogLevel log_level = LoggingSystem::string_to_log_level(config_.daemon.log_level);
        std::string log_file = foreground_mode_ ? "" : config_.daemon.log_file;
        if (!LoggingSystem::initialize(log_level, log_file, 10*1024*1024, 5, foreground_mode_)) {
            std::cerr << "Failed to initialize logging system" << std::endl;
            return false;
        }

        LOG_INFO("Daemon initialization started", {
            {"config_path", config_path},
            {"foreground_mode", foreground_mode_ ? "true" : "false"}
        });

        setup_signal_handlers();

        if (!initialize_components()) {
            LOG_ERROR("Failed to initialize daemon components");
            return false;
        }

        LoggingSystem::log_daemon_startup(ENERGY_ROLLUP_VERSION, config_path);
        LOG_INFO("Daemon initialization completed successfully");
        return true;

    } catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return false;
    } catch (const std::exception& e) {
        error_handler_->handle_error(e, ErrorSeverity::CRITICAL, "initialization");
        return false;
    }
}

void DaemonCore::run() {
    if (running_) {
        LOG_WARN("Daemon is already running");
        return;
    }

    LOG_INFO("Starting daemon main loop");

    running_ = true;
    shutdown_requested_ = false;

    if (!foreground_mode_ && !daemonize()) {
        LOG_ERROR("Failed to daemonize process");
        running_ = false;
        return;
    }

    // Threads do not survive fork(), so the listener starts here
    if (api_server_) {
        if (api_server_->start(config_.http.port, config_.http.bind_address)) {
            LOG_INFO("Serving energy queries", {{"url", api_server_->get_url()}});
        } else {
            LOG_ERROR("Energy API server failed to start, continuing without it", {
                {"port", std::to_string(config_.http.port)},
                {"bind_address", config_.http.bind_address}
            });
        }
    }

    // After the fork so systemd sees the final PID
    notify_systemd("READY=1");

    main_loop();

    notify_systemd("STOPPING=1");
    if (api_server_) {
        api_server_->stop();
    }
    LoggingSystem::log_daemon_shutdown(signal_received_ ?
        "signal " + std::to_string(received_signal_.load()) : "shutdown requested");

    running_ = false;
    LOG_INFO("Daemon shutdown completed");
}

void DaemonCore::shutdown() {
    if (!running_) {
        return;
    }

    LOG_INFO("Shutdown requested");
    shutdown_requested_ = true;
}

bool DaemonCore::is_running() const {
    return running_;
}

PerformanceMetrics DaemonCore::get_metrics() const {
    return metrics_;
}

void DaemonCore::setup_signal_handlers() {
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;

    // Handle SIGTERM (systemd shutdown)
    if (sigaction(SIGTERM, &sa, nullptr) == -1) {
        LOG_ERROR("Failed to setup SIGTERM handler");
    }

    // Handle SIGINT (Ctrl+C)
    if (sigaction(SIGINT, &sa, nullptr) == -1) {
        LOG_ERROR("Failed to setup SIGINT handler");
    }

    signal(SIGPIPE, SIG_IGN);

    LOG_DEBUG("Signal handlers configured");
}

void DaemonCore::signal_handler(int signal) {
    signal_received_ = true;
    received_signal_ = signal;

    if (instance_) {
        instance_->shutdown_requested_ = true;
    }
}

bool DaemonCore::daemonize() {
    if (getppid() == 1) {
        return true; // Already a daemon
    }

    pid_t pid = fork();
    if (pid < 0) {
        LOG_ERROR("First fork failed");
        return false;
    }

    if (pid > 0) {
        std::exit(0);
    }

    if (setsid() < 0) {
        LOG_ERROR("setsid failed");
        return false;
    }

    // Fork again to ensure we can't acquire a controlling terminal
    pid = fork();
    if (pid < 0) {
        LOG_ERROR("Second fork failed");
        return false;
    }

    if (pid > 0) {
        std::exit(0);
    }

    if (chdir("/") < 0) {
        LOG_ERROR("chdir to / failed");
        return false;
    }

    umask(027);

    // The logger and RocksDB keep their own descriptors, only stdio is redirected
    int fd = open("/dev/null", O_RDWR);
    if (fd != -1) {
        dup2(fd, STDIN_FILENO);
        dup2(fd, STDOUT_FILENO);
        dup2(fd, STDERR_FILENO);
        if (fd > STDERR_FILENO) {
            close(fd);
        }
    }

    LOG_DEBUG("Process daemonization completed");
    return true;
}

void DaemonCore::main_loop() {
    LOG_INFO("Entering main event loop", {
        {"aggregation_interval_seconds", std::to_string(config_.daemon.aggregation_interval.count())},
        {"job_enabled", config_.daemon.job_enabled ? "true" : "false"}
    });

    while (!shutdown_requested_ && running_) {
        std::chrono::milliseconds next_delay = config_.daemon.aggregation_interval;

        try {
            if (signal_received_) {
                LOG_INFO("Signal received: " + std::to_string(received_signal_.load()));
                break;
            }

            if (!check_system_health()) {
                LOG_WARN("System health check failed, continuing with caution");
            }

            next_delay = perform_aggregation_cycle();

            cache_->cleanup_expired();

            update_performance_metrics();

        } catch (const std::exception& e) {
            error_handler_->handle_error(e, ErrorSeverity::RECOVERABLE, "main_loop");
            next_delay = std::chrono::seconds(1);
        }

        if (!sleep_until_next_cycle(next_delay)) {
            LOG_DEBUG("Sleep interrupted by shutdown signal");
            break;
        }

        notify_systemd("WATCHDOG=1");
    }

    LOG_INFO("Main event loop exited");
}

std::chrono::milliseconds DaemonCore::perform_aggregation_cycle() {
    const std::string operation = "aggregation";
    std::chrono::milliseconds interval = config_.daemon.aggregation_interval;

    if (!config_.daemon.job_enabled) {
        LOG_DEBUG("Aggregation job is disabled");
        return interval;
    }

    try {
        PERF_TIMER("aggregation_cycle");

        auto outcome = aggregator_->process_latest();
        if (outcome.status == BucketAggregator::RunStatus::SKIPPED) {
            metrics_.job_runs_skipped++;
        } else {
            metrics_.job_runs_succeeded++;
            metrics_.buckets_written += outcome.buckets_written;
        }

        error_handler_->reset_retry_count(operation);
        return interval;

    } catch (const std::exception& e) {
        metrics_.job_runs_failed++;

        ErrorSeverity severity = ErrorHandler::classify(e);
        int attempts = error_handler_->handle_error(e, severity, operation);

        if (severity == ErrorSeverity::RECOVERABLE && error_handler_->should_retry(attempts)) {
            auto delay = std::min<std::chrono::milliseconds>(error_handler_->get_backoff_delay(attempts), interval);
            LOG_WARN("Retrying aggregation in " + std::to_string(delay.count()) + "ms (attempt " +
                     std::to_string(attempts) + ")");
            return delay;
        }

        if (severity == ErrorSeverity::RECOVERABLE) {
            LOG_ERROR("Maximum retry attempts exceeded for aggregation, waiting for next interval");
        }
        error_handler_->reset_retry_count(operation);
        return interval;
    }
}

bool DaemonCore::initialize_components() {
    try {
        LOG_INFO("Initializing daemon components");

        storage_ = std::make_unique<TimeSeriesStorage>();
        if (!storage_->initialize(config_.storage.data_directory,
                                  config_.storage.compression_enabled,
                                  config_.storage.block_cache_mb)) {
            LOG_ERROR("Failed to initialize storage engine", {
                {"data_directory", config_.storage.data_directory}
            });
            return false;
        }
        LOG_INFO("Storage engine initialized successfully", {
            {"data_directory", config_.storage.data_directory},
            {"db_size_bytes", std::to_string(storage_->get_database_size())}
        });

        cache_ = std::make_unique<InMemoryQueryCache>(
            static_cast<size_t>(config_.query.cache_max_entries),
            std::chrono::seconds(config_.query.cache_ttl_seconds));

        BucketAggregator::Options aggregator_options;
        aggregator_options.checkpoint_every_buckets = static_cast<uint32_t>(config_.aggregator.checkpoint_every_buckets);
        aggregator_options.bootstrap_lookback_seconds = config_.aggregator.bootstrap_lookback_hours * SECONDS_PER_HOUR;
        aggregator_ = std::make_unique<BucketAggregator>(*storage_, *storage_, cache_.get(), aggregator_options);

        EnergyQueryEngine::Options query_options;
        query_options.bucket_threshold_seconds = config_.query.bucket_threshold_seconds;
        query_options.cache_ttl = std::chrono::seconds(config_.query.cache_ttl_seconds);
        query_engine_ = std::make_unique<EnergyQueryEngine>(*storage_, *storage_, cache_.get(), query_options);

        if (config_.http.enabled) {
            api_server_ = std::make_unique<EnergyApiServer>(*query_engine_, storage_.get(), config_.pricing);
        }

        LOG_INFO("Component initialization completed", {
            {"storage_healthy", storage_->is_healthy() ? "true" : "false"},
            {"cache_max_entries", std::to_string(config_.query.cache_max_entries)},
            {"checkpoint_every_buckets", std::to_string(config_.aggregator.checkpoint_every_buckets)},
            {"pricing_configured", config_.pricing.has_value() ? "true" : "false"},
            {"http_enabled", config_.http.enabled ? "true" : "false"}
        });

        return true;

    } catch (const std::exception& e) {
        error_handler_->handle_error(e, ErrorSeverity::CRITICAL, "component_initialization");
        return false;
    }
}

void DaemonCore::cleanup_resources() {
    // Reverse order of initialization
    api_server_.reset();
    query_engine_.reset();
    aggregator_.reset();
    cache_.reset();
    storage_.reset();

    LoggingSystem::shutdown();
}

void DaemonCore::update_performance_metrics() {
    auto now = std::chrono::steady_clock::now();

    if (now - last_metrics_log_ >= std::chrono::minutes(5)) {
        auto aggregator_stats = aggregator_->get_statistics();
        auto query_stats = query_engine_->get_statistics();
        auto cache_stats = cache_->get_metrics();

        metrics_.sparse_minutes_skipped = aggregator_stats.sparse_minutes;
        metrics_.queries_served = query_stats.queries_served;
        metrics_.query_cache_hits = query_stats.cache_hits;
        metrics_.slow_operations = query_engine_->get_performance_metrics().slow_queries +
                                   storage_->get_performance_metrics().slow_queries;
        metrics_.cache_entries = cache_stats.entries;
        metrics_.cache_evictions = cache_stats.evictions;
        metrics_.cache_invalidations = cache_stats.invalidations;
        metrics_.memory_usage_bytes = get_memory_usage();
        metrics_.cpu_usage_percent = get_cpu_usage();

        LoggingSystem::log_performance_metrics(metrics_);
        last_metrics_log_ = now;
    }
}

void DaemonCore::notify_systemd(const std::string& status) {
#ifdef HAVE_SYSTEMD
    if (sd_notify(0, status.c_str()) < 0) {
        LOG_DEBUG("Failed to notify systemd: " + status);
    }
#else
    (void)status;
#endif
}

bool DaemonCore::check_system_health() {
    bool system_healthy = true;

    if (!storage_->is_healthy()) {
        LOG_WARN("Storage engine reports unhealthy status", {
            {"db_size_bytes", std::to_string(storage_->get_database_size())}
        });
        system_healthy = false;
    }

    uint64_t memory_usage = get_memory_usage();
    if (memory_usage > 256ULL * 1024 * 1024) {
        LOG_WARN("Memory usage exceeds limit", {
            {"usage_mb", std::to_string(memory_usage / 1024 / 1024)},
            {"limit_mb", "256"}
        });
        system_healthy = false;
    }

    return system_healthy;
}

bool DaemonCore::sleep_until_next_cycle(std::chrono::milliseconds delay) {
    auto start_time = std::chrono::steady_clock::now();

    while (!shutdown_requested_ && !signal_received_) {
        if (std::chrono::steady_clock::now() - start_time >= delay) {
            break;
        }

        // Small increments keep shutdown responsive
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    return !shutdown_requested_ && !signal_received_;
}

uint64_t DaemonCore::get_memory_usage() const {
    std::ifstream status_file("/proc/self/status");
    std::string line;

    while (std::getline(status_file, line)) {
        if (line.rfind("VmRSS:", 0) == 0) {
            std::istringstream iss(line);
            std::string label;
            uint64_t memory_kb = 0;
            iss >> label >> memory_kb;
            return memory_kb * 1024;
        }
    }

    return 0;
}

double DaemonCore::get_cpu_usage() const {
    static auto last_time = std::chrono::steady_clock::now();
    static uint64_t last_cpu_time = 0;

    std::ifstream stat_file("/proc/self/stat");
    std::string line;
    std::getline(stat_file, line);

    // The command name may contain spaces, fields are counted after ')'
    auto name_end = line.rfind(')');
    if (name_end == std::string::npos) {
        return 0.0;
    }

    std::istringstream iss(line.substr(name_end + 2));
    std::string token;
    uint64_t utime = 0, stime = 0;

    // utime and stime are fields 14 and 15, i.e. the 12th and 13th after ')'
    for (int i = 0; i < 11; ++i) {
        iss >> token;
    }
    iss >> utime >> stime;

    uint64_t total_cpu_time = utime + stime;
    auto current_time = std::chrono::steady_clock::now();

    auto time_diff = std::chrono::duration_cast<std::chrono::milliseconds>(current_time - last_time).count();
    uint64_t cpu_diff = total_cpu_time - last_cpu_time;

    double cpu_usage = 0.0;
    if (time_diff > 0 && last_cpu_time > 0) {
        long clock_ticks_per_sec = sysconf(_SC_CLK_TCK);
        cpu_usage = (static_cast<double>(cpu_diff) / clock_ticks_per_sec) / (time_diff / 1000.0) * 100.0;
    }

    last_time = current_time;
    last_cpu_time = total_cpu_time;

    return cpu_usage;
}

} // namespace energy_rollup
