#include "core/workspace_manager.hpp"
#include "core/errors.hpp"
#include "core/random_id.hpp"
#include "logging/logger.hpp"
#include <system_error>

namespace fs = std::filesystem;

namespace
{
    bool isWorkspaceName(const std::string &name)
    {
        return name.rfind(WorkspaceManager::WORKSPACE_PREFIX, 0) == 0;
    }
}

Workspace::Workspace(std::string id, fs::path path)
    : id_(std::move(id)), path_(std::move(path))
{
}

Workspace::~Workspace()
{
    destroy();
}

bool Workspace::destroy() noexcept
{
    if (destroyed_.exchange(true))
    {
        return false;
    }

    // Cleanup failures are logged and never replace the request's own outcome
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec)
    {
        Logger::warn("Failed to remove workspace " + path_.string() + ": " + ec.message());
    }
    else
    {
        Logger::debug("Workspace " + id_ + " removed");
    }
    return true;
}

WorkspaceManager::WorkspaceManager(fs::path temp_root)
    : temp_root_(std::move(temp_root))
{
}

WorkspaceHandle WorkspaceManager::create()
{
    std::error_code ec;
    fs::create_directories(temp_root_, ec);
    if (ec)
    {
        throw ResourceError("Cannot create temp root: " + ec.message());
    }

    fs::space_info space = fs::space(temp_root_, ec);
    if (!ec && space.available == 0)
    {
        throw ResourceError("No space left in temp root");
    }

    // A collision needs the same millisecond and the same 64 random bits; retry anyway
    for (int attempt = 0; attempt < 3; ++attempt)
    {
        auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
        std::string id = std::string(WORKSPACE_PREFIX) + std::to_string(now_ms) + "-" + RandomId::hex(8);
        fs::path path = temp_root_ / id;

        bool created = fs::create_directory(path, ec);
        if (ec)
        {
            throw ResourceError("Cannot create workspace: " + ec.message());
        }
        if (!created)
        {
            Logger::warn("Workspace name collision on " + id + ", retrying");
            continue;
        }

        fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace, ec);
        if (ec)
        {
            Logger::warn("Could not restrict permissions on workspace " + id + ": " + ec.message());
        }

        Logger::debug("Workspace " + id + " created");
        return WorkspaceHandle(new Workspace(id, path));
    }

    throw ResourceError("Cannot allocate a unique workspace");
}

void WorkspaceManager::destroy(const WorkspaceHandle &workspace) noexcept
{
    if (workspace)
    {
        workspace->destroy();
    }
}

size_t WorkspaceManager::sweepStale(std::chrono::seconds min_age) const
{
    std::error_code ec;
    if (!fs::is_directory(temp_root_, ec))
    {
        return 0;
    }

    size_t removed = 0;
    auto now = fs::file_time_type::clock::now();
    for (fs::directory_iterator it(temp_root_, ec), end; !ec && it != end; it.increment(ec))
    {
        const auto &entry = *it;
        std::error_code entry_ec;
        if (!entry.is_directory(entry_ec) || !isWorkspaceName(entry.path().filename().string()))
        {
            continue;
        }

        auto modified = entry.last_write_time(entry_ec);
        if (entry_ec || now - modified < min_age)
        {
            continue;
        }

        fs::remove_all(entry.path(), entry_ec);
        if (entry_ec)
        {
            Logger::warn("Failed to remove stale workspace " + entry.path().string() + ": " + entry_ec.message());
            continue;
        }
        ++removed;
    }

    if (ec)
    {
        Logger::warn("Stale workspace sweep stopped early: " + ec.message());
    }
    if (removed > 0)
    {
        Logger::info("Removed " + std::to_string(removed) + " stale workspace(s) from " + temp_root_.string());
    }
    return removed;
}

size_t WorkspaceManager::countLive() const
{
    std::error_code ec;
    size_t count = 0;
    for (fs::directory_iterator it(temp_root_, ec), end; !ec && it != end; it.increment(ec))
    {
        std::error_code entry_ec;
        if (it->is_directory(entry_ec) && isWorkspaceName(it->path().filename().string()))
        {
            ++count;
        }
    }
    return count;
}
