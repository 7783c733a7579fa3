#include "energy_api_server.hpp"
#include "energy_integrator.hpp"
#include "http_utils.hpp"
#include "json_response_builder.hpp"
#include "logging_system.hpp"
#include <chrono>
#include <cerrno>
#include <cstring>
#include <vector>
#include <fcntl.h>
#include <unistd.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>

namespace energy_rollup {

namespace {

std::string supported_channels() {
    return "home, grid, car, solar";
}

std::string join(const std::vector<std::string>& values) {
    std::string joined;
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) joined += ", ";
        joined += values[i];
    }
    return joined;
}

} // namespace

EnergyApiServer::EnergyApiServer(EnergyQueryEngine& engine,
                                 TimeSeriesStorage* storage,
                                 std::optional<PricingSchedule> pricing,
                                 Clock clock)
    : engine_(engine),
      storage_(storage),
      pricing_(std::move(pricing)),
      clock_(std::move(clock)),
      running_(false),
      server_fd_(-1),
      port_(8080),
      bind_address_("127.0.0.1") {}

EnergyApiServer::~EnergyApiServer() {
    stop();
}

bool EnergyApiServer::start(int port, const std::string& bind_address) {
    if (running_) {
        return true;
    }

    port_ = port;
    bind_address_ = bind_address;

    int server_fd = socket(AF_INET, SOCK_STREAM, 0);
    if (server_fd < 0) {
        LOG_ERROR("Failed to create socket", {{"error", strerror(errno)}});
        return false;
    }

    int opt = 1;
    if (setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        LOG_ERROR("Failed to set socket options", {{"error", strerror(errno)}});
        close(server_fd);
        return false;
    }

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_port = htons(static_cast<uint16_t>(port_));

    if (bind_address_ == "0.0.0.0") {
        address.sin_addr.s_addr = INADDR_ANY;
    } else if (inet_pton(AF_INET, bind_address_.c_str(), &address.sin_addr) != 1) {
        LOG_ERROR("Invalid bind address", {{"bind_address", bind_address_}});
        close(server_fd);
        return false;
    }

    if (bind(server_fd, reinterpret_cast<struct sockaddr*>(&address), sizeof(address)) < 0) {
        LOG_ERROR("Failed to bind socket", {
            {"error", strerror(errno)},
            {"port", std::to_string(port_)}
        });
        close(server_fd);
        return false;
    }

    if (listen(server_fd, 10) < 0) {
        LOG_ERROR("Failed to listen on socket", {{"error", strerror(errno)}});
        close(server_fd);
        return false;
    }

    int flags = fcntl(server_fd, F_GETFL, 0);
    fcntl(server_fd, F_SETFL, flags | O_NONBLOCK);

    server_fd_ = server_fd;
    running_ = true;
    server_thread_ = std::thread(&EnergyApiServer::server_loop, this);

    LOG_INFO("Energy API server listening", {
        {"port", std::to_string(port_)},
        {"bind_address", bind_address_}
    });

    return true;
}

void EnergyApiServer::stop() {
    if (!running_ && !server_thread_.joinable()) {
        return;
    }

    running_ = false;

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    LOG_INFO("Energy API server stopped");
}

bool EnergyApiServer::is_running() const {
    return running_;
}

std::string EnergyApiServer::get_url() const {
    return "http://" + bind_address_ + ":" + std::to_string(port_) + AGGREGATED_PREFIX;
}

void EnergyApiServer::server_loop() {
    while (running_) {
        fd_set read_fds;
        FD_ZERO(&read_fds);
        FD_SET(server_fd_, &read_fds);

        // 1 second timeout keeps stop() responsive
        struct timeval timeout;
        timeout.tv_sec = 1;
        timeout.tv_usec = 0;

        int activity = select(server_fd_ + 1, &read_fds, nullptr, nullptr, &timeout);

        if (activity < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_ERROR("Select error", {{"error", strerror(errno)}});
            break;
        }

        if (activity == 0 || !running_ || !FD_ISSET(server_fd_, &read_fds)) {
            continue;
        }

        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(server_fd_, reinterpret_cast<struct sockaddr*>(&client_addr), &client_len);
        if (client_fd < 0) {
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_ERROR("Accept error", {{"error", strerror(errno)}});
            }
            continue;
        }

        char buffer[MAX_REQUEST_BYTES] = {0};
        ssize_t received = read(client_fd, buffer, sizeof(buffer) - 1);
        if (received <= 0) {
            close(client_fd);
            continue;
        }

        const std::string request(buffer, static_cast<size_t>(received));
        const std::string client_ip = extract_client_ip(client_fd);
        auto request_start_time = std::chrono::steady_clock::now();

        auto [method, path] = HttpParameterParser::extract_method_and_path(request);
        std::string response = handle_request(request);

        auto response_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - request_start_time).count();

        LOG_INFO("Energy API request processed", {
            {"method", method},
            {"path", path},
            {"client_ip", client_ip},
            {"response_time_ms", std::to_string(response_time_ms)},
            {"response_size_bytes", std::to_string(response.length())},
            {"status_code", response.substr(9, 3)}  // "HTTP/1.1 XXX"
        });

        size_t sent = 0;
        while (sent < response.length()) {
            ssize_t written = write(client_fd, response.data() + sent, response.length() - sent);
            if (written <= 0) {
                LOG_WARN("Failed to send response", {
                    {"client_ip", client_ip},
                    {"error", strerror(errno)}
                });
                break;
            }
            sent += static_cast<size_t>(written);
        }
        close(client_fd);
    }

    close(server_fd_);
    server_fd_ = -1;
    running_ = false;
}

std::string EnergyApiServer::handle_request(const std::string& request) {
    auto [method, path] = HttpParameterParser::extract_method_and_path(request);
    if (method.empty()) {
        return JsonResponseBuilder::create_http_error_response(
            HttpStatus::BAD_REQUEST, "Malformed request line");
    }
    return route_request(request, method, path);
}

std::string EnergyApiServer::route_request(const std::string& request,
                                           const std::string& method,
                                           const std::string& path) {
    if (method != "GET") {
        return JsonResponseBuilder::create_http_error_response(
            HttpStatus::METHOD_NOT_ALLOWED, "Method not allowed: " + method, "Only GET is supported");
    }

    if (path == "/health") {
        return handle_health_request();
    }

    const std::string prefix = AGGREGATED_PREFIX;
    if (path.compare(0, prefix.size(), prefix) == 0) {
        std::string type = path.substr(prefix.size());
        if (!type.empty() && type.find('/') == std::string::npos) {
            return handle_aggregated_request(request, type);
        }
    }

    return JsonResponseBuilder::create_http_error_response(
        HttpStatus::NOT_FOUND, "Endpoint not found",
        "The requested path '" + path + "' is not available");
}

std::string EnergyApiServer::handle_health_request() const {
    bool storage_healthy = storage_ != nullptr && storage_->is_healthy();
    QueryPerformanceMonitor::QueryMetrics storage_metrics;
    if (storage_ != nullptr) {
        storage_metrics = storage_->get_performance_metrics();
    }

    std::string body = JsonResponseBuilder::create_health_response(
        storage_healthy, engine_.get_statistics(), storage_metrics);
    return JsonResponseBuilder::create_http_response(
        storage_healthy ? HttpStatus::OK : HttpStatus::SERVICE_UNAVAILABLE, body);
}

std::string EnergyApiServer::handle_aggregated_request(const std::string& request, const std::string& type) {
    auto channel = parse_channel(type);
    if (!channel.has_value()) {
        return JsonResponseBuilder::create_http_error_response(
            HttpStatus::BAD_REQUEST,
            "Invalid energy type: " + type + ". Must be one of: " + supported_channels());
    }

    auto params = HttpParameterParser::parse_query_string(HttpParameterParser::extract_query_string(request));

    const auto timeframe_it = params.find("timeframe");
    const std::string timeframe = timeframe_it != params.end() ? timeframe_it->second : "day";

    auto bounds = TimeframeParser::resolve(timeframe, clock_());
    if (!bounds.has_value()) {
        return JsonResponseBuilder::create_http_error_response(
            HttpStatus::BAD_REQUEST,
            "Invalid timeframe: " + timeframe + ". Must be one of: " +
            join(TimeframeParser::get_supported_timeframes()));
    }

    const auto start_it = params.find("start");
    const auto end_it = params.find("end");
    if ((start_it != params.end()) != (end_it != params.end())) {
        return JsonResponseBuilder::create_http_error_response(
            HttpStatus::BAD_REQUEST, "Both start and end are required for a custom range");
    }

    if (start_it != params.end()) {
        auto start = parse_unix_seconds(start_it->second);
        auto end = parse_unix_seconds(end_it->second);
        if (!start.has_value() || !end.has_value()) {
            return JsonResponseBuilder::create_http_error_response(
                HttpStatus::BAD_REQUEST, "Invalid time range", "start and end must be Unix seconds");
        }
        if (*start > *end) {
            return JsonResponseBuilder::create_http_error_response(
                HttpStatus::BAD_REQUEST, "Invalid time range", "start must not be after end");
        }
        bounds->start = *start;
        bounds->end = *end;
    }

    const auto granularity_it = params.find("granularity");
    if (granularity_it != params.end()) {
        auto granularity = parse_granularity(granularity_it->second);
        if (!granularity.has_value()) {
            return JsonResponseBuilder::create_http_error_response(
                HttpStatus::BAD_REQUEST,
                "Invalid granularity: " + granularity_it->second + ". Must be hour or day");
        }
        bounds->granularity = *granularity;
    }

    try {
        AggregatedResult result = engine_.get_aggregated_energy_data(
            bounds->start, bounds->end, bounds->granularity, *channel);

        return JsonResponseBuilder::create_http_response(
            HttpStatus::OK,
            JsonResponseBuilder::create_query_response(
                result, bounds->start, bounds->end, bounds->granularity, *channel, pricing_));
    } catch (const std::exception& e) {
        ErrorContext context("energy_api", "aggregate");
        context.add_data("channel", channel_to_string(*channel))
               .add_data("from", std::to_string(bounds->start))
               .add_data("to", std::to_string(bounds->end))
               .add_data("error", e.what());
        LoggingSystem::log_with_context(LogLevel::ERROR, "Aggregation request failed", context);

        return JsonResponseBuilder::create_http_error_response(
            HttpStatus::INTERNAL_SERVER_ERROR,
            "Failed to aggregate " + channel_to_string(*channel) + " energy data");
    }
}

std::string EnergyApiServer::extract_client_ip(int client_fd) const {
    struct sockaddr_in client_addr;
    socklen_t client_len = sizeof(client_addr);

    if (getpeername(client_fd, reinterpret_cast<struct sockaddr*>(&client_addr), &client_len) == 0) {
        char ip_str[INET_ADDRSTRLEN];
        if (inet_ntop(AF_INET, &client_addr.sin_addr, ip_str, INET_ADDRSTRLEN)) {
            return std::string(ip_str);
        }
    }

    return "unknown";
}

} // namespace energy_rollup
