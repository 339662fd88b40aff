#include "core/http_server_manager.hpp"
#include <chrono>
#include <iostream>

HttpServerManager::HttpServerManager() : current_host_("0.0.0.0"), current_port_(3000)
{
    Logger::debug("HttpServerManager: Initialized with default configuration");
}

HttpServerManager::~HttpServerManager()
{
    stop();
}

HttpServerManager &HttpServerManager::getInstance()
{
    static HttpServerManager instance;
    return instance;
}

void HttpServerManager::start(const std::string &host, int port)
{
    if (running_.load())
    {
        Logger::warn("HttpServerManager: Server is already running. Stopping current instance first.");
        stop();
    }

    std::lock_guard<std::mutex> lock(server_mutex_);

    {
        std::lock_guard<std::mutex> config_lock(config_mutex_);
        current_host_ = host;
        current_port_ = port;
    }

    // Create new server instance
    server_ = std::make_unique<httplib::Server>();

    const size_t pool_size = limits_.thread_pool_size > 0 ? limits_.thread_pool_size : 1;
    server_->new_task_queue = [pool_size]
    { return new httplib::ThreadPool(pool_size); };
    if (limits_.payload_max_length > 0)
    {
        server_->set_payload_max_length(limits_.payload_max_length);
    }

    // Setup routes
    setupRoutes();

    // Start server thread
    failed_.store(false);
    running_.store(true);
    server_thread_ = std::thread(&HttpServerManager::serverThread, this);

    Logger::info("HttpServerManager: Server starting on " + host + ":" + std::to_string(port) + " with " +
                 std::to_string(pool_size) + " worker threads");
}

void HttpServerManager::stop()
{
    std::lock_guard<std::mutex> lock(server_mutex_);

    if (!running_.load() && !server_thread_.joinable())
    {
        return;
    }

    running_.store(false);

    if (server_)
    {
        server_->stop();
    }

    if (server_thread_.joinable())
    {
        server_thread_.join();
    }

    server_.reset();

    Logger::info("HttpServerManager: Server stopped");
}

bool HttpServerManager::waitUntilReady(std::chrono::milliseconds timeout) const
{
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (failed_.load() || !running_.load())
            return false;
        {
            std::lock_guard<std::mutex> lock(server_mutex_);
            if (server_ && server_->is_running())
                return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
}

void HttpServerManager::setRouteSetupCallback(RouteSetupCallback callback)
{
    route_setup_callback_ = std::move(callback);
}

void HttpServerManager::setLimits(const Limits &limits)
{
    std::lock_guard<std::mutex> lock(server_mutex_);
    limits_ = limits;
}

void HttpServerManager::serverThread()
{
    try
    {
        std::string host;
        int port;

        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            host = current_host_;
            port = current_port_;
        }

        std::cout << "Server starting on http://" << host << ":" << port << std::endl;

        if (!server_->listen(host, port))
        {
            Logger::error("HttpServerManager: Failed to start server on " + host + ":" + std::to_string(port));
            failed_.store(true);
            running_.store(false);
            return;
        }

        Logger::info("HttpServerManager: Server thread completed");
    }
    catch (const std::exception &e)
    {
        Logger::error("HttpServerManager: Server thread error: " + std::string(e.what()));
        failed_.store(true);
        running_.store(false);
    }
}

void HttpServerManager::setupRoutes()
{
    if (!server_)
    {
        Logger::error("HttpServerManager: Cannot setup routes - server is null");
        return;
    }

    if (!route_setup_callback_)
    {
        Logger::warn("HttpServerManager: No route setup callback registered");
        return;
    }

    route_setup_callback_(*server_);
    Logger::info("HttpServerManager: Routes setup completed successfully");
}
