#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "config_manager.hpp"
#include "energy_data.hpp"
#include "time_series_storage.hpp"

namespace energy_rollup {

/**
 * Parsed energy-ctl command line
 */
struct CtlOptions {
    std::string command;
    std::string config_path{"/etc/energy-rollup/config.toml"};
    std::optional<int64_t> from;
    std::optional<int64_t> to;
    ChannelType channel{ChannelType::GRID};
    std::optional<Granularity> granularity;
    std::optional<std::string> timeframe;
};

/**
 * Operator CLI sharing the daemon's configuration and database
 */
class EnergyCtl {
public:
    /**
     * Run energy-ctl
     * @param argc Command line argument count
     * @param argv Command line arguments
     * @return Exit code
     */
    static int run(int argc, char* argv[]);

    /**
     * Parse arguments following the program name
     * @param args Arguments, command first
     * @param error Set to a description of the problem on failure
     * @return Options, or nullopt if the command line is invalid
     */
    static std::optional<CtlOptions> parse_arguments(const std::vector<std::string>& args,
                                                     std::string& error);

    /**
     * Execute a parsed command against an opened database
     * @param options Parsed command line
     * @param config Loaded configuration (pricing, query and aggregator settings)
     * @param storage Opened storage; read-only is enough except for backfill
     * @param out Stream receiving the JSON document
     * @return Exit code
     */
    static int execute(const CtlOptions& options,
                       const DaemonConfig& config,
                       TimeSeriesStorage& storage,
                       std::ostream& out);

    static std::vector<std::string> get_available_commands();

private:
    static void print_usage();

    static int run_query(const CtlOptions& options, const DaemonConfig& config,
                         TimeSeriesStorage& storage, std::ostream& out);
    static int run_backfill(const CtlOptions& options, const DaemonConfig& config,
                            TimeSeriesStorage& storage, std::ostream& out);
    static int run_status(TimeSeriesStorage& storage, std::ostream& out);
    static int run_rollups(const CtlOptions& options, const DaemonConfig& config,
                           TimeSeriesStorage& storage, std::ostream& out);
};

} // namespace energy_rollup
