#include "core/poco_config_manager.hpp"
#include "logging/logger.hpp"
#include <Poco/Exception.h>
#include <fstream>

using Poco::AutoPtr;
using Poco::Util::JSONConfiguration;

PocoConfigManager::PocoConfigManager()
{
    cfg_ = new JSONConfiguration();
    initializeDefaultConfig();
}

void PocoConfigManager::initializeDefaultConfig()
{
    cfg_->setString("server_host", "0.0.0.0");
    cfg_->setInt("server_port", 3000);
    cfg_->setString("log_level", "INFO");

    cfg_->setInt64("limits.max_file_size_bytes", 52428800);
    cfg_->setInt("limits.max_files_per_request", 20);

    cfg_->setInt("jobs.max_concurrent_jobs", 4);
    cfg_->setInt("jobs.queue_wait_ms", 5000);
    cfg_->setInt("jobs.transform_timeout_seconds", 300);

    cfg_->setString("workspace.temp_root", "");
    cfg_->setString("tools.ffmpeg_path", "ffmpeg");
    cfg_->setInt("http.thread_pool_size", 8);
}

bool PocoConfigManager::load(const std::string &path)
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::ifstream in(path);
    if (!in.good())
        return false;
    try
    {
        AutoPtr<JSONConfiguration> tmp = new JSONConfiguration();
        tmp->load(in);
        cfg_ = tmp;
    }
    catch (const Poco::Exception &e)
    {
        Logger::error("Failed to parse configuration file " + path + ": " + e.displayText());
        return false;
    }
    return true;
}

std::string PocoConfigManager::getString(const std::string &key, const std::string &def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getString(key, def);
}

int PocoConfigManager::getInt(const std::string &key, int def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt(key, def);
}

int64_t PocoConfigManager::getInt64(const std::string &key, int64_t def) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return cfg_->getInt64(key, def);
}
