#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <thread>
#include "bucket_aggregator.hpp"
#include "price_calculator.hpp"
#include "query_engine.hpp"
#include "time_series_storage.hpp"

namespace energy_rollup {

/**
 * Minimal HTTP/1.1 endpoint of the daemon, served from one background thread.
 *
 * Routes:
 *   GET /api/energy/aggregated/{home|grid|car|solar}
 *       ?timeframe=day|yesterday|week|month (default day)
 *       ?start=S&end=E (Unix seconds, overrides the timeframe bounds)
 *       ?granularity=hour|day (default follows the timeframe)
 *   GET /health
 */
class EnergyApiServer {
public:
    using Clock = std::function<int64_t()>;

    /**
     * @param engine Query engine answering aggregation requests
     * @param storage Storage reported by /health, may be null
     * @param pricing Schedule used to add costs, none to omit them
     * @param clock Source of "now" for timeframe bounds
     */
    EnergyApiServer(EnergyQueryEngine& engine,
                    TimeSeriesStorage* storage,
                    std::optional<PricingSchedule> pricing,
                    Clock clock = &BucketAggregator::system_now);

    /**
     * Destructor - ensures server is stopped
     */
    ~EnergyApiServer();

    EnergyApiServer(const EnergyApiServer&) = delete;
    EnergyApiServer& operator=(const EnergyApiServer&) = delete;

    /**
     * Bind the listening socket and start the server thread
     * @param port Port to listen on
     * @param bind_address IPv4 address to bind to
     * @return true if the socket is listening
     */
    bool start(int port = 8080, const std::string& bind_address = "127.0.0.1");

    /**
     * Stop accepting connections and join the server thread
     */
    void stop();

    bool is_running() const;

    /**
     * @return Base URL of the aggregation endpoint
     */
    std::string get_url() const;

    /**
     * Answer one raw HTTP request
     * @param request Request text, request line first
     * @return Complete HTTP response
     */
    std::string handle_request(const std::string& request);

private:
    EnergyQueryEngine& engine_;
    TimeSeriesStorage* storage_;
    std::optional<PricingSchedule> pricing_;
    Clock clock_;

    std::atomic<bool> running_;
    int server_fd_;
    int port_;
    std::string bind_address_;
    std::thread server_thread_;

    static constexpr const char* AGGREGATED_PREFIX = "/api/energy/aggregated/";
    static constexpr size_t MAX_REQUEST_BYTES = 8192;

    void server_loop();

    std::string route_request(const std::string& request, const std::string& method, const std::string& path);

    std::string handle_health_request() const;

    std::string handle_aggregated_request(const std::string& request, const std::string& type);

    std::string extract_client_ip(int client_fd) const;
};

} // namespace energy_rollup
