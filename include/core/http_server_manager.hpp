#pragma once

#include <httplib.h>
#include <memory>
#include <thread>
#include <atomic>
#include <mutex>
#include <functional>
#include <string>
#include "logging/logger.hpp"

/**
 * @brief HTTP Server Manager
 *
 * Owns the httplib server and the thread it listens on. Routes are installed
 * through a callback each time a server instance is created.
 */
class HttpServerManager
{
public:
    struct Limits
    {
        size_t thread_pool_size = 8;
        size_t payload_max_length = 0; // 0 keeps the httplib default
    };

    // Singleton pattern
    static HttpServerManager &getInstance();

    // Server lifecycle
    void start(const std::string &host, int port);
    void stop();

    /**
     * @brief Block until the listener is accepting connections
     * @return false if the server failed to bind or was stopped
     */
    bool waitUntilReady(std::chrono::milliseconds timeout) const;

    // Route setup callback
    using RouteSetupCallback = std::function<void(httplib::Server &)>;
    void setRouteSetupCallback(RouteSetupCallback callback);

    void setLimits(const Limits &limits);

private:
    HttpServerManager();
    ~HttpServerManager();
    HttpServerManager(const HttpServerManager &) = delete;
    HttpServerManager &operator=(const HttpServerManager &) = delete;

    // Internal methods
    void serverThread();
    void setupRoutes();

    // Member variables
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> failed_{false};

    // Current configuration
    std::string current_host_;
    int current_port_;
    Limits limits_;

    // Route setup callback
    RouteSetupCallback route_setup_callback_;

    // Thread safety
    mutable std::mutex server_mutex_;
    mutable std::mutex config_mutex_;
};
