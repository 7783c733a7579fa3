#include "config_manager.hpp"
#include <toml.hpp>
#include <filesystem>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <arpa/inet.h>

namespace energy_rollup {

DaemonConfig ConfigManager::load_config(const std::string& config_path) {
    DaemonConfig config = get_default_config();

    if (!std::filesystem::exists(config_path)) {
        throw ConfigurationError("Configuration file not found: " + config_path);
    }

    try {
        const auto toml_data = toml::parse(config_path);

        parse_daemon_section(toml_data, config);
        parse_storage_section(toml_data, config);
        parse_aggregator_section(toml_data, config);
        parse_query_section(toml_data, config);
        parse_http_section(toml_data, config);
        parse_pricing_section(toml_data, config);

        validate_config(config);

        return config;
    }
    catch (const ConfigurationError&) {
        throw;
    }
    catch (const toml::syntax_error& e) {
        throw ConfigurationError("TOML syntax error: " + std::string(e.what()));
    }
    catch (const toml::type_error& e) {
        throw ConfigurationError("TOML type error: " + std::string(e.what()));
    }
    catch (const std::exception& e) {
        throw ConfigurationError("Configuration parsing error: " + std::string(e.what()));
    }
}

DaemonConfig ConfigManager::get_default_config() {
    return DaemonConfig{};  // Uses default member initializers
}

void ConfigManager::validate_config(const DaemonConfig& config) {
    std::ostringstream errors;

    // Validate daemon section
    if (config.daemon.aggregation_interval.count() < 1 || config.daemon.aggregation_interval.count() > 3600) {
        errors << "Aggregation interval must be between 1 and 3600 seconds. ";
    }

    if (!is_valid_log_level(config.daemon.log_level)) {
        errors << "Invalid log level: " << config.daemon.log_level << ". ";
    }

    if (!config.daemon.log_file.empty() && !is_valid_path(config.daemon.log_file)) {
        errors << "Log file directory does not exist: " << config.daemon.log_file << ". ";
    }

    // Validate storage section
    if (config.storage.data_directory.empty()) {
        errors << "Data directory cannot be empty. ";
    } else if (!is_valid_path(config.storage.data_directory)) {
        errors << "Data directory parent does not exist: " << config.storage.data_directory << ". ";
    }

    if (config.storage.block_cache_mb < 1 || config.storage.block_cache_mb > 512) {
        errors << "Block cache must be between 1MB and 512MB. ";
    }

    // Validate aggregator section
    if (config.aggregator.checkpoint_every_buckets < 1 || config.aggregator.checkpoint_every_buckets > 1000) {
        errors << "Checkpoint interval must be between 1 and 1000 buckets. ";
    }

    if (config.aggregator.bootstrap_lookback_hours < 1 || config.aggregator.bootstrap_lookback_hours > 8760) {
        errors << "Bootstrap lookback must be between 1 hour and 1 year. ";
    }

    // Validate query section
    if (config.query.bucket_threshold_seconds < 60 || config.query.bucket_threshold_seconds > 86400) {
        errors << "Bucket threshold must be between 60 and 86400 seconds. ";
    }

    if (config.query.cache_ttl_seconds < 0 || config.query.cache_ttl_seconds > 86400) {
        errors << "Cache TTL must be between 0 and 86400 seconds. ";
    }

    if (config.query.cache_max_entries < 1 || config.query.cache_max_entries > 100000) {
        errors << "Cache size must be between 1 and 100000 entries. ";
    }

    // Validate http section
    if (config.http.port < 1024 || config.http.port > 65535) {
        errors << "HTTP port must be between 1024 and 65535. ";
    }

    in_addr parsed_address{};
    if (inet_pton(AF_INET, config.http.bind_address.c_str(), &parsed_address) != 1) {
        errors << "Invalid HTTP bind address: " << config.http.bind_address << ". ";
    }

    // Validate pricing section
    if (config.pricing.has_value()) {
        if (config.pricing->producing_price < 0.0) {
            errors << "Producing price cannot be negative. ";
        }

        for (size_t i = 0; i < config.pricing->consuming_periods.size(); ++i) {
            const auto& period = config.pricing->consuming_periods[i];
            if (period.start_minute < 0 || period.start_minute > 1439 ||
                period.end_minute < 0 || period.end_minute > 1439) {
                errors << "Consuming period " << i << " minutes must be between 0 and 1439. ";
            }
            if (period.price < 0.0) {
                errors << "Consuming period " << i << " price cannot be negative. ";
            }
        }
    }

    std::string error_string = errors.str();
    if (!error_string.empty()) {
        throw ConfigurationError("Configuration validation failed: " + error_string);
    }
}

void ConfigManager::parse_daemon_section(const toml::value& toml_data, DaemonConfig& config) {
    if (toml_data.contains("daemon")) {
        const auto& daemon_section = toml::find(toml_data, "daemon");

        if (daemon_section.contains("aggregation_interval_seconds")) {
            int interval = toml::find<int>(daemon_section, "aggregation_interval_seconds");
            config.daemon.aggregation_interval = std::chrono::seconds(interval);
        }

        if (daemon_section.contains("log_level")) {
            config.daemon.log_level = toml::find<std::string>(daemon_section, "log_level");
            std::transform(config.daemon.log_level.begin(), config.daemon.log_level.end(),
                         config.daemon.log_level.begin(), ::tolower);
        }

        if (daemon_section.contains("log_file")) {
            config.daemon.log_file = toml::find<std::string>(daemon_section, "log_file");
        }

        if (daemon_section.contains("job_enabled")) {
            config.daemon.job_enabled = toml::find<bool>(daemon_section, "job_enabled");
        }
    }
}

void ConfigManager::parse_storage_section(const toml::value& toml_data, DaemonConfig& config) {
    if (toml_data.contains("storage")) {
        const auto& storage_section = toml::find(toml_data, "storage");

        if (storage_section.contains("data_directory")) {
            config.storage.data_directory = toml::find<std::string>(storage_section, "data_directory");
        }

        if (storage_section.contains("compression_enabled")) {
            config.storage.compression_enabled = toml::find<bool>(storage_section, "compression_enabled");
        }

        if (storage_section.contains("block_cache_mb")) {
            int cache_mb = toml::find<int>(storage_section, "block_cache_mb");
            // Negative sizes are reported by validation instead of wrapping around
            config.storage.block_cache_mb = cache_mb < 0 ? 0 : static_cast<size_t>(cache_mb);
        }
    }
}

void ConfigManager::parse_aggregator_section(const toml::value& toml_data, DaemonConfig& config) {
    if (toml_data.contains("aggregator")) {
        const auto& aggregator_section = toml::find(toml_data, "aggregator");

        if (aggregator_section.contains("checkpoint_every_buckets")) {
            config.aggregator.checkpoint_every_buckets = toml::find<int>(aggregator_section, "checkpoint_every_buckets");
        }

        if (aggregator_section.contains("bootstrap_lookback_hours")) {
            config.aggregator.bootstrap_lookback_hours = toml::find<int>(aggregator_section, "bootstrap_lookback_hours");
        }
    }
}

void ConfigManager::parse_query_section(const toml::value& toml_data, DaemonConfig& config) {
    if (toml_data.contains("query")) {
        const auto& query_section = toml::find(toml_data, "query");

        if (query_section.contains("bucket_threshold_seconds")) {
            config.query.bucket_threshold_seconds = toml::find<int>(query_section, "bucket_threshold_seconds");
        }

        if (query_section.contains("cache_ttl_seconds")) {
            config.query.cache_ttl_seconds = toml::find<int>(query_section, "cache_ttl_seconds");
        }

        if (query_section.contains("cache_max_entries")) {
            config.query.cache_max_entries = toml::find<int>(query_section, "cache_max_entries");
        }
    }
}

void ConfigManager::parse_http_section(const toml::value& toml_data, DaemonConfig& config) {
    if (toml_data.contains("http")) {
        const auto& http_section = toml::find(toml_data, "http");

        if (http_section.contains("enabled")) {
            config.http.enabled = toml::find<bool>(http_section, "enabled");
        }

        if (http_section.contains("port")) {
            config.http.port = toml::find<int>(http_section, "port");
        }

        if (http_section.contains("bind_address")) {
            config.http.bind_address = toml::find<std::string>(http_section, "bind_address");
        }
    }
}

void ConfigManager::parse_pricing_section(const toml::value& toml_data, DaemonConfig& config) {
    if (!toml_data.contains("pricing")) {
        config.pricing.reset();
        return;
    }

    const auto& pricing_section = toml::find(toml_data, "pricing");
    PricingSchedule schedule;

    if (pricing_section.contains("producing_price")) {
        schedule.producing_price = read_number(pricing_section, "producing_price");
    }

    if (pricing_section.contains("consuming_periods")) {
        const auto& periods = toml::find<toml::array>(pricing_section, "consuming_periods");
        for (const auto& entry : periods) {
            ConsumingPeriod period;
            period.start_minute = toml::find<int>(entry, "start_minute");
            period.end_minute = toml::find<int>(entry, "end_minute");
            period.price = read_number(entry, "price");
            schedule.consuming_periods.push_back(period);
        }
    }

    config.pricing = std::move(schedule);
}

double ConfigManager::read_number(const toml::value& section, const std::string& key) {
    const auto& value = toml::find(section, key);
    if (value.is_integer()) {
        return static_cast<double>(value.as_integer());
    }
    return toml::get<double>(value);
}

bool ConfigManager::is_valid_log_level(const std::string& level) {
    static const std::vector<std::string> valid_levels = {
        "trace", "debug", "info", "warn", "error", "critical", "off"
    };

    return std::find(valid_levels.begin(), valid_levels.end(), level) != valid_levels.end();
}

bool ConfigManager::is_valid_path(const std::string& path) {
    if (path.empty()) {
        return false;
    }

    std::filesystem::path fs_path(path);
    if (fs_path.is_absolute()) {
        return true;  // Assume absolute paths can be created
    }

    // For relative paths, check if parent exists
    auto parent = fs_path.parent_path();
    return parent.empty() || std::filesystem::exists(parent);
}

} // namespace energy_rollup
