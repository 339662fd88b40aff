#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

/**
 * @brief Exclusively-owned temporary directory scoped to one request
 *
 * The directory is removed when destroy() is first called or, failing that,
 * when the last handle goes away. Removal happens at most once and never
 * throws.
 */
class Workspace
{
public:
    ~Workspace();

    Workspace(const Workspace &) = delete;
    Workspace &operator=(const Workspace &) = delete;

    const std::string &id() const { return id_; }
    const std::filesystem::path &path() const { return path_; }

    // Path of `name` inside the workspace; `name` must be a server generated file name
    std::filesystem::path resolve(const std::string &name) const { return path_ / name; }

    /**
     * @brief Recursively remove the workspace directory
     * @return true if this call performed the removal, false if it already happened
     */
    bool destroy() noexcept;

    bool isDestroyed() const noexcept { return destroyed_.load(); }

private:
    friend class WorkspaceManager;
    Workspace(std::string id, std::filesystem::path path);

    std::string id_;
    std::filesystem::path path_;
    std::atomic<bool> destroyed_{false};
};

using WorkspaceHandle = std::shared_ptr<Workspace>;

/**
 * @brief Allocates per-request workspaces under a fixed temp root
 *
 * Workspace directories are named "tools-<epoch ms>-<random hex>" so that
 * concurrent requests never collide and leftovers from a previous process can
 * be recognised.
 */
class WorkspaceManager
{
public:
    static constexpr const char *WORKSPACE_PREFIX = "tools-";

    explicit WorkspaceManager(std::filesystem::path temp_root);

    /**
     * @brief Create a fresh workspace directory
     * @throws ResourceError if the temp root is unwritable or out of space
     */
    WorkspaceHandle create();

    /**
     * @brief Destroy a workspace; safe on null or already destroyed handles
     */
    static void destroy(const WorkspaceHandle &workspace) noexcept;

    /**
     * @brief Remove workspace directories left behind by a previous process
     * @param min_age Only directories not modified for at least this long are removed
     * @return Number of directories removed
     */
    size_t sweepStale(std::chrono::seconds min_age) const;

    // Number of workspace directories currently present under the temp root
    size_t countLive() const;

    const std::filesystem::path &tempRoot() const { return temp_root_; }

private:
    std::filesystem::path temp_root_;
};
