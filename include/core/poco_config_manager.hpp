#pragma once

#include <Poco/Util/JSONConfiguration.h>
#include <Poco/AutoPtr.h>
#include <cstdint>
#include <mutex>
#include <string>

/**
 * @brief Thread-safe key/value view over a Poco JSON configuration document
 *
 * Keys use Poco's dotted notation ("jobs.max_concurrent_jobs"). A fresh
 * instance is populated with the service defaults; load() replaces the
 * document and any key missing from the file falls back to the default passed
 * to the getter.
 */
class PocoConfigManager
{
public:
    PocoConfigManager();

    bool load(const std::string &path);

    // Convenience getters
    std::string getString(const std::string &key, const std::string &def) const;
    int getInt(const std::string &key, int def) const;
    int64_t getInt64(const std::string &key, int64_t def) const;

private:
    void initializeDefaultConfig();

    mutable std::mutex mutex_;
    Poco::AutoPtr<Poco::Util::JSONConfiguration> cfg_;
};
