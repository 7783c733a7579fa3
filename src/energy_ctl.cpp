#include "energy_ctl.hpp"
#include "bucket_aggregator.hpp"
#include "energy_integrator.hpp"
#include "json_response_builder.hpp"
#include "logging_system.hpp"
#include "query_engine.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <string>

namespace energy_rollup {

int EnergyCtl::run(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    if (args.empty() || args[0] == "-h" || args[0] == "--help") {
        print_usage();
        return args.empty() ? 1 : 0;
    }

    std::string error;
    auto options = parse_arguments(args, error);
    if (!options.has_value()) {
        std::cerr << "Error: " << error << "\n\n";
        print_usage();
        return 1;
    }

    DaemonConfig config;
    try {
        config = ConfigManager::load_config(options->config_path);
    } catch (const ConfigurationError& e) {
        std::cout << JsonResponseBuilder::create_error_response("Configuration error", e.what());
        return 1;
    }

    // stdout carries the JSON document
    LogLevel log_level = LoggingSystem::string_to_log_level(config.daemon.log_level);
    LoggingSystem::initialize(std::max(log_level, LogLevel::WARN), "", 0, 0, true, true);

    const bool read_only = options->command != "backfill";
    TimeSeriesStorage storage;
    if (!storage.initialize(config.storage.data_directory,
                            config.storage.compression_enabled,
                            config.storage.block_cache_mb,
                            read_only)) {
        std::cout << JsonResponseBuilder::create_error_response(
            "Failed to open database", config.storage.data_directory);
        LoggingSystem::shutdown();
        return 1;
    }

    int exit_code = execute(*options, config, storage, std::cout);
    LoggingSystem::shutdown();
    return exit_code;
}

std::optional<CtlOptions> EnergyCtl::parse_arguments(const std::vector<std::string>& args,
                                                     std::string& error) {
    if (args.empty()) {
        error = "missing command";
        return std::nullopt;
    }

    CtlOptions options;
    options.command = args[0];

    auto commands = get_available_commands();
    if (std::find(commands.begin(), commands.end(), options.command) == commands.end()) {
        error = "unknown command: " + options.command;
        return std::nullopt;
    }

    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& flag = args[i];
        if (i + 1 >= args.size()) {
            error = "missing value for " + flag;
            return std::nullopt;
        }
        const std::string& value = args[++i];

        if (flag == "-c" || flag == "--config") {
            options.config_path = value;
        } else if (flag == "--from" || flag == "--to") {
            auto timestamp = parse_unix_seconds(value);
            if (!timestamp.has_value()) {
                error = "invalid timestamp for " + flag + ": " + value;
                return std::nullopt;
            }
            (flag == "--from" ? options.from : options.to) = timestamp;
        } else if (flag == "--channel") {
            auto channel = parse_channel(value);
            if (!channel.has_value()) {
                error = "invalid channel: " + value;
                return std::nullopt;
            }
            options.channel = *channel;
        } else if (flag == "--granularity") {
            auto granularity = parse_granularity(value);
            if (!granularity.has_value()) {
                error = "invalid granularity: " + value;
                return std::nullopt;
            }
            options.granularity = granularity;
        } else if (flag == "--timeframe") {
            if (!TimeframeParser::is_valid(value)) {
                error = "invalid timeframe: " + value;
                return std::nullopt;
            }
            options.timeframe = value;
        } else {
            error = "unknown option: " + flag;
            return std::nullopt;
        }
    }

    if (options.from.has_value() && options.to.has_value() && *options.from > *options.to) {
        error = "--from must not be after --to";
        return std::nullopt;
    }

    if (options.command == "query") {
        if (options.timeframe.has_value() && (options.from.has_value() || options.to.has_value())) {
            error = "--timeframe cannot be combined with --from/--to";
            return std::nullopt;
        }
        if (!options.timeframe.has_value() && (!options.from.has_value() || !options.to.has_value())) {
            error = "query needs --from and --to, or --timeframe";
            return std::nullopt;
        }
    } else if (options.command == "rollups") {
        if (!options.from.has_value() || !options.to.has_value() || !options.granularity.has_value()) {
            error = "rollups needs --from, --to and --granularity";
            return std::nullopt;
        }
    } else if (options.command == "backfill") {
        if (options.from.has_value() != options.to.has_value()) {
            error = "backfill needs both --from and --to, or neither";
            return std::nullopt;
        }
    }

    return options;
}

int EnergyCtl::execute(const CtlOptions& options,
                       const DaemonConfig& config,
                       TimeSeriesStorage& storage,
                       std::ostream& out) {
    try {
        if (options.command == "query") {
            return run_query(options, config, storage, out);
        }
        if (options.command == "backfill") {
            return run_backfill(options, config, storage, out);
        }
        if (options.command == "status") {
            return run_status(storage, out);
        }
        if (options.command == "rollups") {
            return run_rollups(options, config, storage, out);
        }

        out << JsonResponseBuilder::create_error_response("Unknown command", options.command);
        return 1;

    } catch (const StorageError& e) {
        LOG_ERROR("Command failed", {{"command", options.command}, {"error", e.what()}});
        out << JsonResponseBuilder::create_error_response("Storage error", e.what());
        return 1;
    }
}

std::vector<std::string> EnergyCtl::get_available_commands() {
    return {"query", "backfill", "status", "rollups"};
}


void EnergyCtl::print_usage() {
    std::cout << "Usage: energy-ctl <command> [options]\n";
    std::cout << "\n";
    std::cout << "Commands:\n";
    std::cout << "  query     Aggregated energy for a channel, with costs when pricing is configured\n";
    std::cout << "            --from TS --to TS | --timeframe day|yesterday|week|month\n";
    std::cout << "            [--channel grid|home|car|solar] [--granularity hour|day]\n";
    std::cout << "  backfill  Rebuild minute buckets and rollups [--from TS --to TS]\n";
    std::cout << "  status    Show the aggregation checkpoint and database information\n";
    std::cout << "  rollups   Net energy per hour or day from the rollups\n";
    std::cout << "            --from TS --to TS --granularity hour|day [--channel ...]\n";
    std::cout << "\n";
    std::cout << "Options:\n";
    std::cout << "  -c, --config PATH  Configuration file (default: /etc/energy-rollup/config.toml)\n";
    std::cout << "  -h, --help         Show this help message\n";
    std::cout << "\n";
    std::cout << "Timestamps are Unix seconds.\n";
}

int EnergyCtl::run_query(const CtlOptions& options, const DaemonConfig& config,
                         TimeSeriesStorage& storage, std::ostream& out) {
    int64_t from = options.from.value_or(0);
    int64_t to = options.to.value_or(0);
    Granularity granularity = options.granularity.value_or(Granularity::HOUR);

    if (options.timeframe.has_value()) {
        auto bounds = TimeframeParser::resolve(*options.timeframe, BucketAggregator::system_now());
        if (!bounds.has_value()) {
            out << JsonResponseBuilder::create_error_response("Invalid timeframe", *options.timeframe);
            return 1;
        }
        from = bounds->start;
        to = bounds->end;
        granularity = options.granularity.value_or(bounds->granularity);
    }

    EnergyQueryEngine::Options engine_options;
    engine_options.bucket_threshold_seconds = config.query.bucket_threshold_seconds;
    EnergyQueryEngine engine(storage, storage, nullptr, engine_options);

    auto result = engine.get_aggregated_energy_data(from, to, granularity, options.channel);
    out << JsonResponseBuilder::create_query_response(result, from, to, granularity,
                                                      options.channel, config.pricing);
    return 0;
}

int EnergyCtl::run_backfill(const CtlOptions& options, const DaemonConfig& config,
                            TimeSeriesStorage& storage, std::ostream& out) {
    BucketAggregator::Options aggregator_options;
    aggregator_options.checkpoint_every_buckets = static_cast<uint32_t>(config.aggregator.checkpoint_every_buckets);
    aggregator_options.bootstrap_lookback_seconds = config.aggregator.bootstrap_lookback_hours * SECONDS_PER_HOUR;

    // The daemon's in-process cache entries expire on their own TTL
    BucketAggregator aggregator(storage, storage, nullptr, aggregator_options);

    auto outcome = aggregator.backfill(options.from, options.to);
    out << JsonResponseBuilder::create_backfill_response(outcome);
    if (outcome.has_value() && (outcome->failed_minutes > 0 || !outcome->rollups_rebuilt)) {
        return 2;
    }
    return 0;
}

int EnergyCtl::run_status(TimeSeriesStorage& storage, std::ostream& out) {
    out << JsonResponseBuilder::create_status_response(storage.load_checkpoint(),
                                                       storage.get_database_info());
    return 0;
}

int EnergyCtl::run_rollups(const CtlOptions& options, const DaemonConfig& config,
                           TimeSeriesStorage& storage, std::ostream& out) {
    EnergyQueryEngine::Options engine_options;
    engine_options.bucket_threshold_seconds = config.query.bucket_threshold_seconds;
    EnergyQueryEngine engine(storage, storage, nullptr, engine_options);

    const Granularity granularity = *options.granularity;
    auto response = engine.get_rollup_energy(*options.from, *options.to, granularity, options.channel);
    out << JsonResponseBuilder::create_rollups_response(response, *options.from, *options.to,
                                                        granularity, options.channel);
    return 0;
}

} // namespace energy_rollup
