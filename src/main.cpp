#include "core/http_server_manager.hpp"
#include "core/media_tools_service.hpp"
#include "core/poco_config_manager.hpp"
#include "core/service_config.hpp"
#include "core/shutdown_manager.hpp"
#include "logging/logger.hpp"
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unistd.h>

namespace
{
    constexpr const char *DEFAULT_CONFIG_PATH = "config/config.json";

    // Workspaces untouched for this long at startup belong to a dead process
    constexpr std::chrono::hours STALE_WORKSPACE_AGE{1};

    void printUsage(const char *program)
    {
        std::cout << "Media Tools Server" << std::endl;
        std::cout << "Usage: " << program << " [options]" << std::endl;
        std::cout << "Options:" << std::endl;
        std::cout << "  --config, -c <path>  Configuration file (default: " << DEFAULT_CONFIG_PATH << ")" << std::endl;
        std::cout << "  --help, -h           Show this help message" << std::endl;
        std::cout << "Environment:" << std::endl;
        std::cout << "  PORT                 Overrides server_port" << std::endl;
        std::cout << "  MAX_FILE_SIZE_BYTES  Overrides limits.max_file_size_bytes" << std::endl;
    }
}

int main(int argc, char *argv[])
{
    std::string config_path = DEFAULT_CONFIG_PATH;
    bool explicit_config = false;

    for (int i = 1; i < argc; i++)
    {
        std::string arg = argv[i];
        if (arg == "--config" || arg == "-c")
        {
            if (i + 1 >= argc)
            {
                std::cerr << "Error: " << arg << " requires a path" << std::endl;
                return 1;
            }
            config_path = argv[++i];
            explicit_config = true;
        }
        else if (arg == "--help" || arg == "-h")
        {
            printUsage(argv[0]);
            return 0;
        }
        else
        {
            std::cerr << "Error: unknown option " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    Logger::init("INFO");

    // Load configuration; a missing default file means built-in defaults
    PocoConfigManager config_manager;
    if (std::filesystem::exists(config_path))
    {
        if (!config_manager.load(config_path))
        {
            Logger::error("Failed to load configuration from " + config_path);
            return 1;
        }
        Logger::info("Loaded configuration from " + config_path);
    }
    else if (explicit_config)
    {
        Logger::error("Configuration file not found: " + config_path);
        return 1;
    }
    else
    {
        Logger::info("No configuration file at " + config_path + ", using defaults");
    }

    ServiceConfig service_config;
    try
    {
        service_config = ServiceConfig::fromConfigManager(config_manager);
    }
    catch (const std::invalid_argument &e)
    {
        Logger::error("Invalid configuration: " + std::string(e.what()));
        return 1;
    }

    Logger::setLevel(service_config.log_level);
    Logger::info("Starting media tools server (PID: " + std::to_string(getpid()) + ")...");

    ShutdownManager::getInstance().installSignalHandlers();

    MediaToolsService service(service_config);

    service.workspaces().sweepStale(STALE_WORKSPACE_AGE);

    auto &http_server_manager = HttpServerManager::getInstance();
    HttpServerManager::Limits limits;
    limits.thread_pool_size = static_cast<size_t>(service_config.http_thread_pool_size);
    limits.payload_max_length = static_cast<size_t>(service.payloadLimitBytes());
    http_server_manager.setLimits(limits);
    http_server_manager.setRouteSetupCallback([&service](httplib::Server &server)
                                              { service.installRoutes(server); });

    // In-flight jobs are cancelled before the listener stops so workers drain quickly
    auto &shutdown_manager = ShutdownManager::getInstance();
    shutdown_manager.addHook("cancel-jobs", [&service]()
                             { service.cancelAll("server shutting down"); });
    shutdown_manager.addHook("stop-http", [&http_server_manager]()
                             { http_server_manager.stop(); });

    http_server_manager.start(service_config.server_host, service_config.server_port);
    if (!http_server_manager.waitUntilReady(std::chrono::seconds(5)))
    {
        Logger::error("HTTP server did not come up on " + service_config.server_host + ":" +
                      std::to_string(service_config.server_port));
        http_server_manager.stop();
        return 1;
    }
    Logger::info("Listening on " + service_config.server_host + ":" + std::to_string(service_config.server_port));

    // Wait for shutdown signal via centralized manager
    shutdown_manager.waitForShutdown();

    Logger::info("Shutdown requested (" + shutdown_manager.getReason() + "), cleaning up...");
    size_t failures = shutdown_manager.runHooks();

    Logger::info("Server shutdown complete");
    return failures == 0 ? 0 : 1;
}
