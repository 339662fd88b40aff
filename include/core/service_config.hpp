#pragma once

#include "core/poco_config_manager.hpp"
#include <cstdint>
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>

/**
 * @brief Immutable process-wide service settings
 *
 * Built once at startup from the JSON configuration file plus environment
 * overrides and injected into every component that needs it. Nothing mutates
 * it afterwards.
 */
struct ServiceConfig
{
    std::string server_host = "0.0.0.0";
    int server_port = 3000;
    std::string log_level = "INFO";

    uint64_t max_file_size_bytes = 52428800;
    int max_files_per_request = 20;

    int max_concurrent_jobs = 4;
    int queue_wait_ms = 5000;
    int transform_timeout_seconds = 300;

    std::filesystem::path temp_root;
    std::string ffmpeg_path = "ffmpeg";
    int http_thread_pool_size = 8;

    /**
     * @brief Freeze a configuration document into a ServiceConfig
     * @param manager Loaded configuration
     * @param apply_environment Apply PORT and MAX_FILE_SIZE_BYTES overrides
     * @throws std::invalid_argument if a value is out of its valid range
     */
    static ServiceConfig fromConfigManager(const PocoConfigManager &manager, bool apply_environment = true);

    nlohmann::json toJson() const;
};
