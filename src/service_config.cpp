#include "core/service_config.hpp"
#include "logging/logger.hpp"
#include <cstdlib>
#include <stdexcept>

namespace
{
    // Returns false and leaves `out` untouched when the variable is unset or not numeric
    bool readNumericEnv(const char *name, long long &out)
    {
        const char *raw = std::getenv(name);
        if (!raw || !*raw)
            return false;

        char *end = nullptr;
        long long value = std::strtoll(raw, &end, 10);
        if (end == raw || *end != '\0')
        {
            Logger::warn(std::string("Ignoring non-numeric environment variable ") + name + "=" + raw);
            return false;
        }
        out = value;
        return true;
    }
}

ServiceConfig ServiceConfig::fromConfigManager(const PocoConfigManager &manager, bool apply_environment)
{
    ServiceConfig config;

    config.server_host = manager.getString("server_host", config.server_host);
    config.server_port = manager.getInt("server_port", config.server_port);
    config.log_level = manager.getString("log_level", config.log_level);

    config.max_file_size_bytes = static_cast<uint64_t>(
        manager.getInt64("limits.max_file_size_bytes", static_cast<int64_t>(config.max_file_size_bytes)));
    config.max_files_per_request = manager.getInt("limits.max_files_per_request", config.max_files_per_request);

    config.max_concurrent_jobs = manager.getInt("jobs.max_concurrent_jobs", config.max_concurrent_jobs);
    config.queue_wait_ms = manager.getInt("jobs.queue_wait_ms", config.queue_wait_ms);
    config.transform_timeout_seconds = manager.getInt("jobs.transform_timeout_seconds", config.transform_timeout_seconds);

    std::string temp_root = manager.getString("workspace.temp_root", "");
    config.temp_root = temp_root.empty() ? std::filesystem::temp_directory_path() : std::filesystem::path(temp_root);
    config.ffmpeg_path = manager.getString("tools.ffmpeg_path", config.ffmpeg_path);
    config.http_thread_pool_size = manager.getInt("http.thread_pool_size", config.http_thread_pool_size);

    if (apply_environment)
    {
        long long value = 0;
        if (readNumericEnv("PORT", value))
            config.server_port = static_cast<int>(value);
        if (readNumericEnv("MAX_FILE_SIZE_BYTES", value))
        {
            if (value <= 0)
                throw std::invalid_argument("MAX_FILE_SIZE_BYTES must be positive");
            config.max_file_size_bytes = static_cast<uint64_t>(value);
        }
    }

    if (config.server_port <= 0 || config.server_port > 65535)
        throw std::invalid_argument("server_port out of range: " + std::to_string(config.server_port));
    if (config.max_file_size_bytes == 0)
        throw std::invalid_argument("limits.max_file_size_bytes must be positive");
    if (config.max_files_per_request < 2)
        throw std::invalid_argument("limits.max_files_per_request must be at least 2");
    if (config.max_concurrent_jobs < 1)
        throw std::invalid_argument("jobs.max_concurrent_jobs must be at least 1");
    if (config.queue_wait_ms < 0)
        throw std::invalid_argument("jobs.queue_wait_ms must not be negative");
    if (config.transform_timeout_seconds < 1)
        throw std::invalid_argument("jobs.transform_timeout_seconds must be at least 1");
    if (config.http_thread_pool_size < 1)
        throw std::invalid_argument("http.thread_pool_size must be at least 1");

    return config;
}

nlohmann::json ServiceConfig::toJson() const
{
    return {
        {"server_host", server_host},
        {"server_port", server_port},
        {"log_level", log_level},
        {"limits", {{"max_file_size_bytes", max_file_size_bytes}, {"max_files_per_request", max_files_per_request}}},
        {"jobs", {{"max_concurrent_jobs", max_concurrent_jobs}, {"queue_wait_ms", queue_wait_ms}, {"transform_timeout_seconds", transform_timeout_seconds}}},
        {"workspace", {{"temp_root", temp_root.string()}}},
        {"tools", {{"ffmpeg_path", ffmpeg_path}}},
        {"http", {{"thread_pool_size", http_thread_pool_size}}}};
}
