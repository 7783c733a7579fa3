#pragma once

#include <string>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <vector>
#include <toml.hpp>
#include "price_calculator.hpp"

namespace energy_rollup {

/**
 * Configuration structure containing all daemon and CLI settings
 */
struct DaemonConfig {
    struct DaemonSettings {
        std::chrono::seconds aggregation_interval{60};
        std::string log_level{"info"};
        std::string log_file{"/var/log/energy-rollup/daemon.log"};
        bool job_enabled{true};
    } daemon;

    struct StorageSettings {
        std::string data_directory{"/var/lib/energy-rollup"};
        bool compression_enabled{true};
        size_t block_cache_mb{8};
    } storage;

    struct AggregatorSettings {
        int checkpoint_every_buckets{10};
        int bootstrap_lookback_hours{24};
    } aggregator;

    struct QuerySettings {
        int bucket_threshold_seconds{3600};
        int cache_ttl_seconds{300};
        int cache_max_entries{1024};
    } query;

    struct HttpSettings {
        bool enabled{true};
        int port{8080};
        std::string bind_address{"127.0.0.1"};
    } http;

    // Absent when the file has no [pricing] section
    std::optional<PricingSchedule> pricing;
};

/**
 * Exception thrown when configuration parsing or validation fails
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Configuration manager for parsing TOML configuration files
 */
class ConfigManager {
public:
    /**
     * Load configuration from file
     * @param config_path Path to TOML configuration file
     * @return Parsed and validated configuration
     * @throws ConfigurationError if file cannot be parsed or validation fails
     */
    static DaemonConfig load_config(const std::string& config_path);

    /**
     * Get default configuration
     * @return Configuration with default values
     */
    static DaemonConfig get_default_config();

    /**
     * Validate configuration values, reporting every problem at once
     * @param config Configuration to validate
     * @throws ConfigurationError if validation fails
     */
    static void validate_config(const DaemonConfig& config);

private:
    static void parse_daemon_section(const toml::value& toml_data, DaemonConfig& config);

    static void parse_storage_section(const toml::value& toml_data, DaemonConfig& config);

    static void parse_aggregator_section(const toml::value& toml_data, DaemonConfig& config);

    static void parse_query_section(const toml::value& toml_data, DaemonConfig& config);

    static void parse_http_section(const toml::value& toml_data, DaemonConfig& config);

    /**
     * Parse [pricing] and its [[pricing.consuming_periods]] tables
     */
    static void parse_pricing_section(const toml::value& toml_data, DaemonConfig& config);

    /**
     * Read a number that may be written as an integer or a float
     */
    static double read_number(const toml::value& section, const std::string& key);

    static bool is_valid_log_level(const std::string& level);

    static bool is_valid_path(const std::string& path);
};

} // namespace energy_rollup
