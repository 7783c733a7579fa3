#include <iostream>
#include <string>
#include <cstdlib>
#include <getopt.h>
#include <unistd.h>
#include <iomanip>
#include "daemon_core.hpp"
#include "config_manager.hpp"

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS]\n"
              << "Energy Rollup Daemon\n\n"
              << "Options:\n"
              << "  -c, --config PATH    Configuration file path (default: /etc/energy-rollup/config.toml)\n"
              << "  -h, --help          Show this help message\n"
              << "  -v, --version       Show version information\n"
              << "  -f, --foreground    Run in foreground (don't daemonize)\n"
              << std::endl;
}

void print_version() {
    std::cout << "Energy Rollup Daemon v" << energy_rollup::ENERGY_ROLLUP_VERSION << "\n"
#ifdef HAVE_SYSTEMD
              << "Built with C++20, RocksDB, and systemd support\n"
#else
              << "Built with C++20 and RocksDB\n"
#endif
              << std::endl;
}

int main(int argc, char* argv[]) {
    std::string config_path = "/etc/energy-rollup/config.toml";
    bool foreground = false;

    static struct option long_options[] = {
        {"config", required_argument, 0, 'c'},
        {"help", no_argument, 0, 'h'},
        {"version", no_argument, 0, 'v'},
        {"foreground", no_argument, 0, 'f'},
        {0, 0, 0, 0}
    };

    int option_index = 0;
    int c;

    while ((c = getopt_long(argc, argv, "c:hvf", long_options, &option_index)) != -1) {
        switch (c) {
            case 'c':
                config_path = optarg;
                break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            case 'v':
                print_version();
                return 0;
            case 'f':
                foreground = true;
                break;
            case '?':
                print_usage(argv[0]);
                return 1;
            default:
                break;
        }
    }

    if (!config_path.empty() && access(config_path.c_str(), R_OK) != 0) {
        std::cerr << "Error: Configuration file '" << config_path
                  << "' is not readable or does not exist" << std::endl;
        return 1;
    }

    try {
        energy_rollup::DaemonCore daemon;

        if (foreground) {
            std::cout << "Initializing energy rollup daemon..." << std::endl;
            std::cout << "Configuration file: " << config_path << std::endl;
        }

        if (!daemon.initialize(config_path, foreground)) {
            std::cerr << "Failed to initialize daemon. Check logs for details." << std::endl;
            if (foreground) {
                std::cerr << "Common issues:" << std::endl;
                std::cerr << "  - Configuration file not found or invalid" << std::endl;
                std::cerr << "  - Insufficient permissions for data directory" << std::endl;
                std::cerr << "  - Database locked by another process" << std::endl;
            }
            return 1;
        }

        if (foreground) {
            std::cout << "Energy rollup daemon initialized successfully" << std::endl;
            std::cout << "Starting aggregation loop..." << std::endl;
            std::cout << "Press Ctrl+C to stop the daemon" << std::endl;
        }

        daemon.run();

        if (foreground) {
            auto metrics = daemon.get_metrics();
            std::cout << "Energy rollup daemon stopped." << std::endl;
            std::cout << "Session statistics:" << std::endl;
            std::cout << "  Uptime: " << metrics.get_uptime().count() << " seconds" << std::endl;
            std::cout << "  Completed job runs: " << metrics.job_runs_succeeded << std::endl;
            std::cout << "  Failed job runs: " << metrics.job_runs_failed << std::endl;
            std::cout << "  Skipped job runs: " << metrics.job_runs_skipped << std::endl;
            std::cout << "  Buckets written: " << metrics.buckets_written << std::endl;
            if (metrics.job_runs_succeeded + metrics.job_runs_failed > 0) {
                std::cout << "  Job success rate: " <<
                    std::fixed << std::setprecision(1) <<
                    (metrics.get_job_success_rate() * 100.0) << "%" << std::endl;
            }
        }

        return 0;

    } catch (const energy_rollup::ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        std::cerr << "Please check your configuration file: " << config_path << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
